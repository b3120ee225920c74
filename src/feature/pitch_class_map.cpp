/// @file pitch_class_map.cpp
/// @brief Implementation of PitchClassMap.

#include "feature/pitch_class_map.h"

#include <algorithm>

#include "core/convert.h"

namespace cadenza {

PitchClassMap::PitchClassMap(double sample_rate, size_t n_bins, int low_cut, int high_cut,
                             double ref_hz)
    : sample_rate_(sample_rate),
      low_cut_(low_cut),
      high_cut_(high_cut),
      ref_hz_(ref_hz),
      classes_(n_bins, static_cast<int8_t>(kExcludedBin)) {
  rebuild();
}

bool PitchClassMap::update(double sample_rate, size_t n_bins, int low_cut, int high_cut,
                           double ref_hz) {
  if (sample_rate == sample_rate_ && n_bins == classes_.size() && low_cut == low_cut_ &&
      high_cut == high_cut_ && ref_hz == ref_hz_) {
    return false;
  }
  sample_rate_ = sample_rate;
  low_cut_ = low_cut;
  high_cut_ = high_cut;
  ref_hz_ = ref_hz;
  classes_.assign(n_bins, static_cast<int8_t>(kExcludedBin));
  rebuild();
  return true;
}

void PitchClassMap::rebuild() {
  retained_ = 0;
  size_t n_bins = classes_.size();
  if (n_bins == 0 || low_cut_ > high_cut_) {
    return;
  }

  size_t first = static_cast<size_t>(std::max(low_cut_, 0));
  size_t last = std::min(static_cast<size_t>(std::max(high_cut_, 0)), n_bins - 1);

  for (size_t bin = first; bin <= last; ++bin) {
    double frequency = bin_to_hz(bin, sample_rate_, n_bins);
    /// log2 is undefined at 0 Hz
    if (frequency <= 0.0) continue;
    classes_[bin] = static_cast<int8_t>(hz_to_pitch_class(frequency, ref_hz_));
    ++retained_;
  }
}

}  // namespace cadenza
