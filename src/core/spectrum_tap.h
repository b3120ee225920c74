#pragma once

/// @file spectrum_tap.h
/// @brief Turns a mono sample stream into fixed-length magnitude frames.

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

#include "util/types.h"

namespace cadenza {

// Forward declarations
class FFT;

/// @brief Configuration for SpectrumTap.
struct TapConfig {
  int n_bins = 1024;                     ///< Magnitudes per frame (0 Hz up to just below Nyquist)
  int hop_length = 1024;                 ///< Samples between consecutive frames
  WindowType window = WindowType::Hann;  ///< Window applied before the FFT

  /// @brief Returns FFT size (2 * n_bins).
  int n_fft() const { return 2 * n_bins; }
};

/// @brief Windowed FFT front end producing MagnitudeFrame values.
/// @details Keeps the tail of the previous chunk so frames may straddle calls.
/// Frame k covers samples [k * hop_length, k * hop_length + n_fft). Magnitudes
/// are scaled by 2 / sum(window), so a sine of amplitude A peaks near A.
///
/// The emitted frame is only valid during the callback.
class SpectrumTap {
 public:
  /// @brief Receives each frame and the stream position of its first sample.
  using FrameCallback = std::function<void(const MagnitudeFrame& frame, size_t sample_offset)>;

  /// @brief Constructs tap.
  /// @param config Tap configuration
  /// @throws CadenzaException(InvalidParameter) if n_bins < 1 or hop_length is
  ///         outside [1, n_fft]
  explicit SpectrumTap(const TapConfig& config = TapConfig());

  ~SpectrumTap();

  // Non-copyable, movable
  SpectrumTap(const SpectrumTap&) = delete;
  SpectrumTap& operator=(const SpectrumTap&) = delete;
  SpectrumTap(SpectrumTap&&) noexcept;
  SpectrumTap& operator=(SpectrumTap&&) noexcept;

  /// @brief Appends samples and emits every frame that became complete.
  /// @param samples Mono input samples
  /// @param n_samples Number of samples
  /// @param on_frame Called once per frame, in order
  /// @return Number of frames emitted
  size_t process(const float* samples, size_t n_samples, const FrameCallback& on_frame);

  /// @brief Drops buffered samples and restarts the stream position at 0.
  void reset();

  /// @brief Returns configuration.
  const TapConfig& config() const { return config_; }

  /// @brief Returns number of samples buffered but not yet hopped past.
  size_t buffered_samples() const { return overlap_buffer_.size(); }

 private:
  TapConfig config_;
  std::unique_ptr<FFT> fft_;
  std::vector<float> window_;
  float scale_ = 1.0f;

  // Stream position of overlap_buffer_[0]
  size_t buffer_offset_ = 0;
  std::vector<float> overlap_buffer_;

  // Working buffers (reused to avoid allocation)
  std::vector<float> frame_buffer_;  // [n_fft]
  std::vector<float> magnitude_;     // [n_fft / 2 + 1]
};

}  // namespace cadenza
