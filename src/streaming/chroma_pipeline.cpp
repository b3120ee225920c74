/// @file chroma_pipeline.cpp
/// @brief Implementation of ChromaPipeline.

#include "streaming/chroma_pipeline.h"

#include <string>

#include "feature/loudness.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace cadenza {

namespace {

const PipelineConfig& validated(const PipelineConfig& config) {
  config.validate();
  return config;
}

ActivityLevel classify_activity(float raw_loudness, float music_threshold) {
  return raw_loudness > music_threshold ? ActivityLevel::HearingMusic : ActivityLevel::Listening;
}

}  // namespace

ChromaPipeline::ChromaPipeline(const PipelineConfig& config, float sample_rate, size_t n_bins)
    : config_(validated(config)),
      sample_rate_(sample_rate),
      configured_bins_(n_bins),
      n_bins_(n_bins),
      sensitivity_(config.sensitivity),
      reducer_(config.to_reducer_config()) {
  CADENZA_CHECK_MSG(is_positive_finite(sample_rate), ErrorCode::InvalidParameter,
                    "Sample rate must be positive");
}

ChromaSnapshot ChromaPipeline::process(const MagnitudeFrame& frame) {
  /// Reject malformed frames before any state is written
  CADENZA_CHECK_MSG(!frame.empty(), ErrorCode::InvalidParameter, "Magnitude frame is empty");
  CADENZA_CHECK_MSG(n_bins_ == 0 || frame.size() == n_bins_, ErrorCode::InvalidParameter,
                    "Magnitude frame has " + std::to_string(frame.size()) + " bins, expected " +
                        std::to_string(n_bins_));
  CADENZA_CHECK_MSG(all_finite(frame.data(), frame.size()), ErrorCode::InvalidParameter,
                    "Magnitude frame contains non-finite values");
  if (n_bins_ == 0) {
    n_bins_ = frame.size();
  }

  /// Both stages see the same gain even if the UI changes it mid-frame
  float sensitivity = sensitivity_.load(std::memory_order_relaxed);

  LoudnessResult loudness = estimate_loudness(frame, sensitivity, config_.skip_bins);

  ChromaSnapshot snapshot;
  snapshot.frame_index = frame_count_;
  snapshot.loudness = loudness.level;
  snapshot.raw_loudness = loudness.raw;
  snapshot.chroma = reducer_.update(frame, loudness.raw, sensitivity, sample_rate_);
  snapshot.active = reducer_.last_active();
  snapshot.activity = classify_activity(loudness.raw, config_.music_threshold);

  ++frame_count_;
  publisher_.publish(snapshot);
  return snapshot;
}

void ChromaPipeline::stop() {
  reducer_.reset();
  frame_count_ = 0;
  n_bins_ = configured_bins_;
  publisher_.publish(ChromaSnapshot());
}

void ChromaPipeline::set_sensitivity(float sensitivity) {
  CADENZA_CHECK_MSG(is_positive_finite(sensitivity), ErrorCode::InvalidParameter,
                    "Sensitivity must be positive");
  sensitivity_.store(sensitivity, std::memory_order_relaxed);
}

}  // namespace cadenza
