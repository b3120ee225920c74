/// @file fft.cpp
/// @brief Implementation of FFT wrapper.

#include "core/fft.h"

#include <cmath>
#include <stdexcept>

#include "util/exception.h"

extern "C" {
#include "kiss_fft.h"
#include "kiss_fftr.h"
}

namespace cadenza {

struct FFT::Impl {
  kiss_fftr_cfg forward_cfg;

  explicit Impl(int n_fft) {
    forward_cfg = kiss_fftr_alloc(n_fft, 0, nullptr, nullptr);
    if (!forward_cfg) {
      throw std::runtime_error("Failed to allocate KissFFT config");
    }
  }

  ~Impl() {
    if (forward_cfg) kiss_fft_free(forward_cfg);
  }
};

FFT::FFT(int n_fft) : n_fft_(n_fft) {
  /// kiss_fftr requires an even length
  CADENZA_CHECK_MSG(n_fft > 0 && n_fft % 2 == 0, ErrorCode::InvalidParameter,
                    "FFT size must be a positive even number");
  scratch_.resize(n_bins());
  impl_ = std::make_unique<Impl>(n_fft);
}

FFT::~FFT() = default;

FFT::FFT(FFT&&) noexcept = default;
FFT& FFT::operator=(FFT&&) noexcept = default;

void FFT::forward(const float* input, std::complex<float>* output) {
  kiss_fftr(impl_->forward_cfg, input, reinterpret_cast<kiss_fft_cpx*>(output));
}

void FFT::magnitude(const float* input, float* output) {
  forward(input, scratch_.data());
  int bins = n_bins();
  for (int k = 0; k < bins; ++k) {
    float re = scratch_[k].real();
    float im = scratch_[k].imag();
    output[k] = std::sqrt(re * re + im * im);
  }
}

}  // namespace cadenza
