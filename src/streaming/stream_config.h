#pragma once

/// @file stream_config.h
/// @brief Configuration for streaming chroma extraction from raw samples.

#include "core/spectrum_tap.h"
#include "streaming/pipeline_config.h"
#include "util/exception.h"
#include "util/types.h"

namespace cadenza {

/// @brief Configuration for ChromaStream.
struct StreamConfig {
  // Basic parameters
  int sample_rate = 44100;               ///< Sample rate in Hz
  int n_bins = 1024;                     ///< Magnitudes per frame
  int hop_length = 1024;                 ///< Hop length between frames
  WindowType window = WindowType::Hann;  ///< Window function type

  // Reduction policy
  PipelineConfig pipeline;

  // Output configuration
  int emit_every_n_frames = 1;  ///< Queue every Nth frame (for throttling)

  // Helper methods

  /// @brief Throws CadenzaException(InvalidParameter) naming the first invalid field.
  void validate() const {
    CADENZA_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter, "Sample rate must be positive");
    CADENZA_CHECK_MSG(n_bins >= 1, ErrorCode::InvalidParameter, "n_bins must be >= 1");
    CADENZA_CHECK_MSG(hop_length >= 1 && hop_length <= n_fft(), ErrorCode::InvalidParameter,
                      "hop_length must be in [1, 2 * n_bins]");
    CADENZA_CHECK_MSG(emit_every_n_frames >= 1, ErrorCode::InvalidParameter,
                      "emit_every_n_frames must be >= 1");
    pipeline.validate();
  }

  /// @brief Returns FFT size.
  int n_fft() const { return 2 * n_bins; }

  /// @brief Returns frame hop duration in seconds.
  float frame_duration() const {
    return static_cast<float>(hop_length) / static_cast<float>(sample_rate);
  }

  /// @brief Returns Hz per magnitude bin.
  float bin_resolution() const {
    return static_cast<float>(sample_rate) / static_cast<float>(n_fft());
  }

  /// @brief Converts to TapConfig for the magnitude front end.
  TapConfig to_tap_config() const { return TapConfig{n_bins, hop_length, window}; }
};

}  // namespace cadenza
