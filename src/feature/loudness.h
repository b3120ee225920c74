#pragma once

/// @file loudness.h
/// @brief Peak-based loudness estimate of a magnitude frame.

#include "util/types.h"

namespace cadenza {

/// @brief Default number of low bins ignored by the loudness estimate.
/// @details The lowest bins carry DC offset and device noise rather than sound.
constexpr int kDefaultSkipBins = 4;

/// @brief Result of a loudness estimate.
struct LoudnessResult {
  float level = 0.0f;  ///< Amplified peak clamped to [0, 1]
  float raw = 0.0f;    ///< Amplified peak before clamping (drives the activity gate)
};

/// @brief Estimates loudness as the amplified peak magnitude.
/// @param frame Magnitude frame
/// @param sensitivity Gain applied to the peak (> 0)
/// @param skip_bins Number of leading bins to ignore (>= 0)
/// @return level = min(peak * sensitivity, 1) and the unclamped raw value.
///         Both are 0 when no bins remain after skipping.
/// @throws CadenzaException(InvalidParameter) if sensitivity is not positive or
///         skip_bins is negative
LoudnessResult estimate_loudness(const MagnitudeFrame& frame, float sensitivity,
                                 int skip_bins = kDefaultSkipBins);

}  // namespace cadenza
