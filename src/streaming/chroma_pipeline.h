#pragma once

/// @file chroma_pipeline.h
/// @brief Loudness estimate and chroma reduction driven once per magnitude frame.

#include <atomic>
#include <cstddef>
#include <utility>

#include "feature/chroma_reducer.h"
#include "streaming/chroma_snapshot.h"
#include "streaming/pipeline_config.h"
#include "streaming/snapshot_publisher.h"

namespace cadenza {

/// @brief Owns the per-session reduction state and publishes one snapshot per frame.
/// @details Frames must be fed in arrival order from a single producer thread
/// (process() and stop() are not reentrant). Any thread may read snapshot() or
/// change the sensitivity at any time.
///
/// Usage:
/// @code
///   ChromaPipeline pipeline(PipelineConfig(), 44100.0f);
///   pipeline.subscribe([](const ChromaSnapshot& s) { draw(s.loudness, s.chroma); });
///
///   // In the capture callback:
///   pipeline.process(MagnitudeFrame(magnitudes, 1024));
///
///   // On a UI thread:
///   auto latest = pipeline.snapshot();
/// @endcode
class ChromaPipeline {
 public:
  /// @brief Constructs pipeline.
  /// @param config Pipeline configuration (config.sensitivity is the initial value)
  /// @param sample_rate Sample rate of the capture session in Hz
  /// @param n_bins Expected frame length; 0 fixes it from the first frame
  /// @throws CadenzaException(InvalidParameter) on invalid configuration or sample rate
  ChromaPipeline(const PipelineConfig& config, float sample_rate, size_t n_bins = 0);

  // Non-copyable, non-movable (publisher is shared with observers)
  ChromaPipeline(const ChromaPipeline&) = delete;
  ChromaPipeline& operator=(const ChromaPipeline&) = delete;

  /// @brief Reduces one magnitude frame and publishes the result.
  /// @param frame Magnitude frame of exactly n_bins() values
  /// @return The published snapshot
  /// @throws CadenzaException(InvalidParameter) on empty, wrong-length or non-finite frames;
  ///         no state is modified in that case
  ChromaSnapshot process(const MagnitudeFrame& frame);

  /// @brief Convenience overload for raw arrays.
  ChromaSnapshot process(const float* magnitudes, size_t n_bins) {
    return process(MagnitudeFrame(magnitudes, n_bins));
  }

  /// @brief Ends the session: zeroes the held chroma and publishes a Stopped snapshot.
  /// @details A frame length learned from the first frame is forgotten.
  void stop();

  /// @brief Sets the sensitivity used from the next frame on.
  /// @throws CadenzaException(InvalidParameter) if not positive
  void set_sensitivity(float sensitivity);

  /// @brief Returns the current sensitivity.
  float sensitivity() const { return sensitivity_.load(std::memory_order_relaxed); }

  /// @brief Returns the latest published snapshot.
  SnapshotPublisher::SnapshotPtr snapshot() const { return publisher_.latest(); }

  /// @brief Registers an observer called on the producer thread after each publish.
  SnapshotPublisher::SubscriptionId subscribe(SnapshotPublisher::Callback callback) {
    return publisher_.subscribe(std::move(callback));
  }

  /// @brief Removes an observer.
  bool unsubscribe(SnapshotPublisher::SubscriptionId id) { return publisher_.unsubscribe(id); }

  /// @brief Returns configuration.
  const PipelineConfig& config() const { return config_; }

  /// @brief Returns sample rate in Hz.
  float sample_rate() const { return sample_rate_; }

  /// @brief Returns the frame length in use (0 if not yet known).
  size_t n_bins() const { return n_bins_; }

  /// @brief Returns number of frames processed since construction or stop().
  int frame_count() const { return frame_count_; }

 private:
  PipelineConfig config_;
  float sample_rate_;
  size_t configured_bins_;
  size_t n_bins_;
  std::atomic<float> sensitivity_;
  ChromaReducer reducer_;
  SnapshotPublisher publisher_;
  int frame_count_ = 0;
};

}  // namespace cadenza
