#pragma once

/// @file stream_frame.h
/// @brief Frame structures for streaming chroma extraction.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "util/types.h"

namespace cadenza {

/// @brief A single frame of streaming results.
/// @details The timestamp is stream time (position of the frame's first input
/// sample), not wall-clock time.
struct StreamFrame {
  float timestamp = 0.0f;     ///< Timestamp in seconds (stream time)
  int frame_index = 0;        ///< Frame index (0-based, cumulative)
  float loudness = 0.0f;      ///< Loudness estimate in [0, 1]
  float raw_loudness = 0.0f;  ///< Amplified peak before clamping
  ChromaVector chroma{};      ///< Chroma vector [12]
  bool active = false;        ///< True if chroma was computed fresh
  ActivityLevel activity = ActivityLevel::Stopped;
};

/// @brief Frame buffer in Structure of Arrays format.
struct FrameBuffer {
  size_t n_frames = 0;  ///< Number of frames in buffer

  std::vector<float> timestamps;  ///< [n_frames]
  std::vector<float> loudness;    ///< [n_frames]
  std::vector<float> chroma;      ///< [n_frames * 12] (row-major)
  std::vector<uint8_t> active;    ///< [n_frames] 1 = fresh chroma, 0 = decayed

  /// @brief Clears all data.
  void clear() {
    n_frames = 0;
    timestamps.clear();
    loudness.clear();
    chroma.clear();
    active.clear();
  }

  /// @brief Reserves capacity for n frames.
  void reserve(size_t n) {
    timestamps.reserve(n);
    loudness.reserve(n);
    chroma.reserve(n * kNumChroma);
    active.reserve(n);
  }
};

}  // namespace cadenza
