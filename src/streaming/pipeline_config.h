#pragma once

/// @file pipeline_config.h
/// @brief Numeric policy of the loudness/chroma pipeline.

#include "feature/chroma_reducer.h"
#include "feature/loudness.h"

namespace cadenza {

/// @brief Lower end of the sensitivity range offered to users.
constexpr float kMinSensitivity = 1.0f;
/// @brief Upper end of the sensitivity range offered to users.
constexpr float kMaxSensitivity = 20.0f;

/// @brief Clamps a user-supplied sensitivity to [kMinSensitivity, kMaxSensitivity].
/// @details For UI collaborators; the pipeline itself only requires > 0.
float clamp_sensitivity(float sensitivity);

/// @brief Configuration for ChromaPipeline.
struct PipelineConfig {
  float sensitivity = 5.0f;          ///< Gain for loudness and chroma normalization
  int skip_bins = kDefaultSkipBins;  ///< Leading bins ignored by the loudness estimate
  float activity_threshold = 0.1f;   ///< Raw loudness gate for fresh chroma computation
  float decay_factor = 0.8f;         ///< Chroma multiplier per silent frame
  int low_cut = 10;                  ///< First bin mapped to a pitch class
  int high_cut = 500;                ///< Last bin mapped to a pitch class
  float tuning_ref_hz = 440.0f;      ///< Reference frequency for A4
  float music_threshold = 0.5f;      ///< Raw loudness above which activity is HearingMusic

  /// @brief Throws CadenzaException(InvalidParameter) naming the first invalid field.
  void validate() const;

  /// @brief Converts to ChromaReducerConfig.
  ChromaReducerConfig to_reducer_config() const {
    return ChromaReducerConfig{activity_threshold, decay_factor, low_cut, high_cut, tuning_ref_hz};
  }
};

}  // namespace cadenza
