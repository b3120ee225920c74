/// @file spectrum_tap.cpp
/// @brief Implementation of SpectrumTap.

#include "core/spectrum_tap.h"

#include <algorithm>

#include "core/fft.h"
#include "core/window.h"
#include "util/exception.h"

namespace cadenza {

SpectrumTap::SpectrumTap(const TapConfig& config) : config_(config) {
  CADENZA_CHECK_MSG(config_.n_bins >= 1, ErrorCode::InvalidParameter, "n_bins must be >= 1");
  CADENZA_CHECK_MSG(config_.hop_length >= 1 && config_.hop_length <= config_.n_fft(),
                    ErrorCode::InvalidParameter, "hop_length must be in [1, 2 * n_bins]");

  int n_fft = config_.n_fft();
  fft_ = std::make_unique<FFT>(n_fft);
  window_ = create_window(config_.window, n_fft);
  scale_ = window_amplitude_scale(window_);

  frame_buffer_.resize(n_fft);
  magnitude_.resize(fft_->n_bins());
  overlap_buffer_.reserve(n_fft + config_.hop_length);
}

SpectrumTap::~SpectrumTap() = default;

SpectrumTap::SpectrumTap(SpectrumTap&&) noexcept = default;
SpectrumTap& SpectrumTap::operator=(SpectrumTap&&) noexcept = default;

size_t SpectrumTap::process(const float* samples, size_t n_samples, const FrameCallback& on_frame) {
  if (samples == nullptr || n_samples == 0) {
    return 0;
  }

  overlap_buffer_.insert(overlap_buffer_.end(), samples, samples + n_samples);

  size_t n_fft = static_cast<size_t>(config_.n_fft());
  size_t hop = static_cast<size_t>(config_.hop_length);
  size_t emitted = 0;

  while (overlap_buffer_.size() >= n_fft) {
    /// Apply window
    for (size_t i = 0; i < n_fft; ++i) {
      frame_buffer_[i] = overlap_buffer_[i] * window_[i];
    }

    fft_->magnitude(frame_buffer_.data(), magnitude_.data());

    /// The Nyquist bin is dropped so the frame holds exactly n_bins values
    for (int k = 0; k < config_.n_bins; ++k) {
      magnitude_[k] *= scale_;
    }

    if (on_frame) {
      on_frame(MagnitudeFrame(magnitude_.data(), static_cast<size_t>(config_.n_bins)),
               buffer_offset_);
    }
    ++emitted;

    /// Slide buffer by hop_length
    overlap_buffer_.erase(overlap_buffer_.begin(), overlap_buffer_.begin() + hop);
    buffer_offset_ += hop;
  }

  return emitted;
}

void SpectrumTap::reset() {
  overlap_buffer_.clear();
  buffer_offset_ = 0;
}

}  // namespace cadenza
