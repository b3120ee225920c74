#pragma once

/// @file chroma_reducer.h
/// @brief Per-frame reduction of a magnitude spectrum to a 12-bin chroma vector.

#include "feature/pitch_class_map.h"
#include "util/types.h"

namespace cadenza {

/// @brief Configuration for ChromaReducer.
struct ChromaReducerConfig {
  float activity_threshold = 0.1f;  ///< Raw loudness at or below this decays instead of computing
  float decay_factor = 0.8f;        ///< Per-frame multiplier applied while silent
  int low_cut = 10;                 ///< First retained bin (inclusive), skips rumble
  int high_cut = 500;               ///< Last retained bin (inclusive), skips ultrasonic noise
  float tuning_ref_hz = 440.0f;     ///< Reference frequency for A4
};

/// @brief Returns true if the raw amplified loudness opens the activity gate.
/// @details The gate is strict: a value equal to the threshold stays closed.
inline bool is_active(float raw_loudness, float activity_threshold) {
  return raw_loudness > activity_threshold;
}

/// @brief Computes a fresh chroma vector from one frame.
/// @param frame Magnitude frame (must match map.n_bins())
/// @param sensitivity Secondary gain applied after max-normalization
/// @param map Bin-to-pitch-class table for the frame layout
/// @return min(accum[k] / max(accum) * sensitivity, 1) per class, or all zeros
///         when no retained bin carries energy
ChromaVector reduce_chroma(const MagnitudeFrame& frame, float sensitivity, const PitchClassMap& map);

/// @brief Scales every element of a chroma vector by a decay factor.
ChromaVector decay_chroma(const ChromaVector& previous, float decay_factor);

/// @brief Stateful chroma stage: computes on activity, fades out on silence.
/// @details Holds the last emitted vector. Not thread-safe; one producer
/// thread calls update() in frame arrival order.
class ChromaReducer {
 public:
  /// @brief Constructs reducer with configuration.
  /// @param config Reducer configuration
  /// @throws CadenzaException(InvalidParameter) for an invalid configuration
  explicit ChromaReducer(const ChromaReducerConfig& config = ChromaReducerConfig());

  /// @brief Produces the chroma vector for one frame.
  /// @param frame Magnitude frame
  /// @param raw_loudness Unclamped amplified loudness from estimate_loudness()
  /// @param sensitivity Gain (> 0)
  /// @param sample_rate Sample rate in Hz (> 0)
  /// @return New chroma vector, which also becomes previous()
  /// @throws CadenzaException(InvalidParameter) on non-positive sensitivity or sample rate,
  ///         or a frame holding NaN or infinity (state is left unchanged)
  const ChromaVector& update(const MagnitudeFrame& frame, float raw_loudness, float sensitivity,
                             float sample_rate);

  /// @brief Returns the last emitted vector (all zeros before the first update).
  const ChromaVector& previous() const { return previous_; }

  /// @brief True if the last update took the computation path.
  bool last_active() const { return last_active_; }

  /// @brief Clears the held vector to all zeros.
  void reset();

  /// @brief Returns configuration.
  const ChromaReducerConfig& config() const { return config_; }

  /// @brief Returns the cached pitch-class table.
  const PitchClassMap& pitch_class_map() const { return map_; }

 private:
  ChromaReducerConfig config_;
  PitchClassMap map_;
  ChromaVector previous_{};
  bool last_active_ = false;
};

}  // namespace cadenza
