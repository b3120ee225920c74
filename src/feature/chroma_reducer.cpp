/// @file chroma_reducer.cpp
/// @brief Implementation of ChromaReducer.

#include "feature/chroma_reducer.h"

#include <Eigen/Core>
#include <algorithm>

#include "util/exception.h"
#include "util/math_utils.h"

namespace cadenza {

namespace {

using ChromaArray = Eigen::Array<float, kNumChroma, 1>;
using ChromaAccum = Eigen::Array<double, kNumChroma, 1>;

}  // namespace

ChromaVector reduce_chroma(const MagnitudeFrame& frame, float sensitivity, const PitchClassMap& map) {
  /// Double accumulation keeps sums of large finite float magnitudes finite
  ChromaAccum accum = ChromaAccum::Zero();
  size_t n_bins = std::min(frame.size(), map.n_bins());

  for (size_t bin = 0; bin < n_bins; ++bin) {
    int pc = map.pitch_class(bin);
    if (pc == kExcludedBin) continue;
    accum(pc) += static_cast<double>(frame[bin]);
  }

  ChromaVector chroma{};
  double max_accum = accum.maxCoeff();
  if (!(max_accum > 0.0)) {
    return chroma;
  }

  /// Sensitivity acts again here so several classes can reach the ceiling
  ChromaAccum normalized = (accum / max_accum * static_cast<double>(sensitivity)).max(0.0).min(1.0);
  Eigen::Map<ChromaArray>(chroma.data()) = normalized.cast<float>();
  return chroma;
}

ChromaVector decay_chroma(const ChromaVector& previous, float decay_factor) {
  ChromaVector chroma;
  Eigen::Map<ChromaArray>(chroma.data()) = Eigen::Map<const ChromaArray>(previous.data()) * decay_factor;
  return chroma;
}

ChromaReducer::ChromaReducer(const ChromaReducerConfig& config) : config_(config) {
  CADENZA_CHECK_MSG(config_.activity_threshold >= 0.0f, ErrorCode::InvalidParameter,
                    "activity_threshold must be >= 0");
  CADENZA_CHECK_MSG(config_.decay_factor >= 0.0f && config_.decay_factor <= 1.0f,
                    ErrorCode::InvalidParameter, "decay_factor must be in [0, 1]");
  CADENZA_CHECK_MSG(config_.low_cut >= 0 && config_.high_cut >= config_.low_cut,
                    ErrorCode::InvalidParameter, "Retained band must satisfy 0 <= low_cut <= high_cut");
  CADENZA_CHECK_MSG(is_positive_finite(config_.tuning_ref_hz), ErrorCode::InvalidParameter,
                    "tuning_ref_hz must be positive");
}

const ChromaVector& ChromaReducer::update(const MagnitudeFrame& frame, float raw_loudness,
                                          float sensitivity, float sample_rate) {
  CADENZA_CHECK_MSG(is_positive_finite(sensitivity), ErrorCode::InvalidParameter,
                    "Sensitivity must be positive");
  CADENZA_CHECK_MSG(is_positive_finite(sample_rate), ErrorCode::InvalidParameter,
                    "Sample rate must be positive");
  CADENZA_CHECK_MSG(all_finite(frame.data(), frame.size()), ErrorCode::InvalidParameter,
                    "Magnitude frame contains non-finite values");

  last_active_ = is_active(raw_loudness, config_.activity_threshold);
  if (!last_active_) {
    previous_ = decay_chroma(previous_, config_.decay_factor);
    return previous_;
  }

  map_.update(sample_rate, frame.size(), config_.low_cut, config_.high_cut, config_.tuning_ref_hz);
  previous_ = reduce_chroma(frame, sensitivity, map_);
  return previous_;
}

void ChromaReducer::reset() {
  previous_.fill(0.0f);
  last_active_ = false;
}

}  // namespace cadenza
