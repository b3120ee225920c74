#pragma once

/// @file pitch_class_map.h
/// @brief Cached bin-to-pitch-class projection for a fixed frame layout.

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cadenza {

/// @brief Marker for bins that never contribute to the chroma vector.
constexpr int kExcludedBin = -1;

/// @brief Maps every bin of a magnitude frame to a pitch class.
/// @details Bin i has frequency i * sample_rate / (2 * n_bins). Bins inside
/// [low_cut, high_cut] with a positive frequency map to the pitch class of the
/// nearest equal-tempered note; all others map to kExcludedBin.
/// The table is rebuilt only when the layout changes.
class PitchClassMap {
 public:
  PitchClassMap() = default;

  /// @brief Builds the map.
  /// @param sample_rate Sample rate in Hz (> 0)
  /// @param n_bins Number of bins in each frame
  /// @param low_cut First retained bin index (inclusive)
  /// @param high_cut Last retained bin index (inclusive)
  /// @param ref_hz Frequency of A4
  PitchClassMap(double sample_rate, size_t n_bins, int low_cut, int high_cut, double ref_hz);

  /// @brief Rebuilds the table if any layout parameter differs.
  /// @return true if the table was rebuilt
  bool update(double sample_rate, size_t n_bins, int low_cut, int high_cut, double ref_hz);

  /// @brief Returns the pitch class of a bin, or kExcludedBin.
  /// @details Total over all indices; indices >= n_bins are excluded.
  int pitch_class(size_t bin) const {
    return bin < classes_.size() ? classes_[bin] : kExcludedBin;
  }

  /// @brief Number of bins the table covers.
  size_t n_bins() const { return classes_.size(); }

  /// @brief Number of bins that contribute to some pitch class.
  size_t retained_bins() const { return retained_; }

  double sample_rate() const { return sample_rate_; }
  int low_cut() const { return low_cut_; }
  int high_cut() const { return high_cut_; }

 private:
  void rebuild();

  double sample_rate_ = 0.0;
  int low_cut_ = 0;
  int high_cut_ = -1;
  double ref_hz_ = 440.0;
  size_t retained_ = 0;
  std::vector<int8_t> classes_;
};

}  // namespace cadenza
