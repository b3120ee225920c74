/// @file convert.cpp
/// @brief Implementation of unit conversion functions.

#include "core/convert.h"

#include <cmath>

#include "util/math_utils.h"
#include "util/types.h"

namespace cadenza {

double hz_to_midi(double hz, double ref_hz) {
  if (hz <= 0.0) return 0.0;
  return 69.0 + 12.0 * std::log2(hz / ref_hz);
}

int midi_to_pitch_class(double midi) {
  int nearest = static_cast<int>(std::round(midi));
  return positive_mod(nearest, kNumChroma);
}

int hz_to_pitch_class(double hz, double ref_hz) {
  if (hz <= 0.0) return -1;
  return midi_to_pitch_class(hz_to_midi(hz, ref_hz));
}

double bin_resolution(double sample_rate, size_t n_bins) {
  if (n_bins == 0) return 0.0;
  return sample_rate / (2.0 * static_cast<double>(n_bins));
}

double bin_to_hz(size_t bin, double sample_rate, size_t n_bins) {
  return static_cast<double>(bin) * bin_resolution(sample_rate, n_bins);
}

size_t hz_to_bin(double hz, double sample_rate, size_t n_bins) {
  double resolution = bin_resolution(sample_rate, n_bins);
  if (hz <= 0.0 || resolution <= 0.0) return 0;
  return static_cast<size_t>(std::round(hz / resolution));
}

}  // namespace cadenza
