/// @file chroma_stream.cpp
/// @brief Implementation of ChromaStream.

#include "streaming/chroma_stream.h"

#include <algorithm>

#include "util/exception.h"

namespace cadenza {

ChromaStream::ChromaStream(const StreamConfig& config)
    : config_(config), tap_(config.to_tap_config()) {
  config_.validate();
  pipeline_ = std::make_unique<ChromaPipeline>(
      config_.pipeline, static_cast<float>(config_.sample_rate), static_cast<size_t>(config_.n_bins));
}

ChromaStream::~ChromaStream() = default;

ChromaStream::ChromaStream(ChromaStream&&) noexcept = default;
ChromaStream& ChromaStream::operator=(ChromaStream&&) noexcept = default;

void ChromaStream::process(const float* samples, size_t n_samples) {
  if (samples == nullptr || n_samples == 0) {
    return;
  }

  tap_.process(samples, n_samples, [this](const MagnitudeFrame& frame, size_t sample_offset) {
    on_frame(frame, sample_offset);
  });
  cumulative_samples_ += n_samples;
}

void ChromaStream::on_frame(const MagnitudeFrame& frame, size_t sample_offset) {
  ChromaSnapshot snapshot = pipeline_->process(frame);
  ++frame_count_;

  /// Throttled frames still advance the pipeline so decay stays continuous
  ++emitted_frame_count_;
  if (emitted_frame_count_ < config_.emit_every_n_frames) {
    return;
  }
  emitted_frame_count_ = 0;

  StreamFrame out;
  out.timestamp = static_cast<float>(sample_offset) / static_cast<float>(config_.sample_rate);
  out.frame_index = snapshot.frame_index;
  out.loudness = snapshot.loudness;
  out.raw_loudness = snapshot.raw_loudness;
  out.chroma = snapshot.chroma;
  out.active = snapshot.active;
  out.activity = snapshot.activity;
  output_buffer_.push_back(out);
}

std::vector<StreamFrame> ChromaStream::read_frames(size_t max_frames) {
  size_t count = std::min(max_frames, output_buffer_.size());
  std::vector<StreamFrame> result;
  result.reserve(count);

  for (size_t i = 0; i < count; ++i) {
    result.push_back(output_buffer_.front());
    output_buffer_.pop_front();
  }

  return result;
}

void ChromaStream::read_frames_soa(size_t max_frames, FrameBuffer& buffer) {
  buffer.clear();

  size_t count = std::min(max_frames, output_buffer_.size());
  buffer.n_frames = count;

  if (count == 0) {
    return;
  }

  buffer.reserve(count);

  for (size_t i = 0; i < count; ++i) {
    const StreamFrame& frame = output_buffer_.front();

    buffer.timestamps.push_back(frame.timestamp);
    buffer.loudness.push_back(frame.loudness);
    buffer.active.push_back(frame.active ? 1 : 0);

    // Append chroma (row-major)
    buffer.chroma.insert(buffer.chroma.end(), frame.chroma.begin(), frame.chroma.end());

    output_buffer_.pop_front();
  }
}

void ChromaStream::reset() {
  tap_.reset();
  pipeline_->stop();
  frame_count_ = 0;
  emitted_frame_count_ = 0;
  cumulative_samples_ = 0;
  output_buffer_.clear();
}

float ChromaStream::current_time() const {
  return static_cast<float>(cumulative_samples_) / static_cast<float>(config_.sample_rate);
}

}  // namespace cadenza
