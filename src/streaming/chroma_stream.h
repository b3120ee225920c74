#pragma once

/// @file chroma_stream.h
/// @brief Streaming chroma extraction from raw audio samples.

#include <deque>
#include <memory>
#include <vector>

#include "core/spectrum_tap.h"
#include "streaming/chroma_pipeline.h"
#include "streaming/stream_config.h"
#include "streaming/stream_frame.h"

namespace cadenza {

/// @brief Feeds a sample stream through SpectrumTap and ChromaPipeline.
/// @details Processes audio in chunks of any size, keeping overlap state
/// between calls, and queues one StreamFrame per emitted magnitude frame.
///
/// Usage:
/// @code
///   ChromaStream stream(config);
///
///   // In the audio callback:
///   stream.process(samples, n_samples);
///
///   // Elsewhere:
///   for (const auto& frame : stream.read_frames(16)) {
///     visualize(frame);
///   }
/// @endcode
class ChromaStream {
 public:
  /// @brief Constructs stream with configuration.
  /// @param config Stream configuration
  /// @throws CadenzaException(InvalidParameter) on invalid configuration
  explicit ChromaStream(const StreamConfig& config);

  ~ChromaStream();

  // Non-copyable, movable
  ChromaStream(const ChromaStream&) = delete;
  ChromaStream& operator=(const ChromaStream&) = delete;
  ChromaStream(ChromaStream&&) noexcept;
  ChromaStream& operator=(ChromaStream&&) noexcept;

  /// @brief Processes an audio chunk.
  /// @param samples Input samples (mono)
  /// @param n_samples Number of samples
  void process(const float* samples, size_t n_samples);

  /// @brief Returns number of frames available to read.
  size_t available_frames() const { return output_buffer_.size(); }

  /// @brief Reads processed frames from internal buffer.
  /// @param max_frames Maximum number of frames to read
  /// @return Vector of frames (up to max_frames, may be empty)
  /// @details Frames are consumed from internal buffer after reading.
  std::vector<StreamFrame> read_frames(size_t max_frames);

  /// @brief Reads processed frames into SOA buffer.
  /// @param max_frames Maximum number of frames to read
  /// @param buffer Output buffer (cleared and filled)
  void read_frames_soa(size_t max_frames, FrameBuffer& buffer);

  /// @brief Resets stream state; the held chroma vector returns to zero.
  void reset();

  /// @brief Returns the pipeline (for sensitivity changes, snapshots, observers).
  ChromaPipeline& pipeline() { return *pipeline_; }
  const ChromaPipeline& pipeline() const { return *pipeline_; }

  /// @brief Returns configuration.
  const StreamConfig& config() const { return config_; }

  /// @brief Returns total frames processed.
  int frame_count() const { return frame_count_; }

  /// @brief Returns current time position (seconds).
  float current_time() const;

 private:
  void on_frame(const MagnitudeFrame& frame, size_t sample_offset);

  StreamConfig config_;
  SpectrumTap tap_;
  std::unique_ptr<ChromaPipeline> pipeline_;

  int frame_count_ = 0;
  int emitted_frame_count_ = 0;  // For emit_every_n_frames
  size_t cumulative_samples_ = 0;

  // Output queue
  std::deque<StreamFrame> output_buffer_;
};

}  // namespace cadenza
