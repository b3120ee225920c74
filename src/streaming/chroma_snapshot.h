#pragma once

/// @file chroma_snapshot.h
/// @brief Immutable per-frame output of the chroma pipeline.

#include "util/types.h"

namespace cadenza {

/// @brief Loudness and chroma produced for one magnitude frame.
/// @details Published as a whole; readers never see a partially updated vector.
struct ChromaSnapshot {
  int frame_index = -1;       ///< 0-based index of the frame, -1 before the first frame
  float loudness = 0.0f;      ///< Loudness estimate in [0, 1]
  float raw_loudness = 0.0f;  ///< Amplified peak before clamping
  ChromaVector chroma{};      ///< Pitch-class energies in [0, 1], 0 = C
  bool active = false;        ///< True if chroma was computed fresh, false if decayed
  ActivityLevel activity = ActivityLevel::Stopped;
};

}  // namespace cadenza
