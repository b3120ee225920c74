/// @file loudness.cpp
/// @brief Implementation of the loudness estimate.

#include "feature/loudness.h"

#include "util/exception.h"
#include "util/math_utils.h"

namespace cadenza {

LoudnessResult estimate_loudness(const MagnitudeFrame& frame, float sensitivity, int skip_bins) {
  CADENZA_CHECK_MSG(is_positive_finite(sensitivity), ErrorCode::InvalidParameter,
                    "Sensitivity must be positive");
  CADENZA_CHECK_MSG(skip_bins >= 0, ErrorCode::InvalidParameter, "skip_bins must be >= 0");

  LoudnessResult result;
  size_t skip = static_cast<size_t>(skip_bins);
  if (frame.empty() || frame.size() <= skip) {
    return result;
  }

  float peak = max_value(frame.data() + skip, frame.size() - skip);
  result.raw = peak * sensitivity;
  result.level = clamp(result.raw, 0.0f, 1.0f);
  return result;
}

}  // namespace cadenza
