#pragma once

/// @file fft.h
/// @brief Real FFT wrapper using KissFFT.

#include <complex>
#include <memory>
#include <vector>

namespace cadenza {

/// @brief Real-valued forward FFT processor using KissFFT.
///
/// Thread Safety:
/// - Different instances can be used concurrently from different threads.
/// - A single instance must NOT be shared between threads without external
///   synchronization, as the scratch spectrum is modified during computation.
class FFT {
 public:
  /// @brief Constructs FFT processor.
  /// @param n_fft FFT size (even; power of 2 for efficiency)
  /// @throws CadenzaException if n_fft is not a positive even number
  /// @throws std::runtime_error if allocation fails
  explicit FFT(int n_fft);

  ~FFT();

  // Non-copyable, movable
  FFT(const FFT&) = delete;
  FFT& operator=(const FFT&) = delete;
  FFT(FFT&&) noexcept;
  FFT& operator=(FFT&&) noexcept;

  /// @brief Performs forward FFT (real to complex).
  /// @param input Input signal of n_fft samples
  /// @param output Complex spectrum of n_bins values
  void forward(const float* input, std::complex<float>* output);

  /// @brief Computes the magnitude spectrum of a real signal.
  /// @param input Input signal of n_fft samples
  /// @param output Magnitudes of n_bins values
  void magnitude(const float* input, float* output);

  /// @brief Returns FFT size.
  int n_fft() const { return n_fft_; }

  /// @brief Returns number of frequency bins (n_fft/2 + 1).
  int n_bins() const { return n_fft_ / 2 + 1; }

 private:
  int n_fft_;
  std::vector<std::complex<float>> scratch_;
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace cadenza
