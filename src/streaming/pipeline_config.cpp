/// @file pipeline_config.cpp
/// @brief Validation of PipelineConfig.

#include "streaming/pipeline_config.h"

#include "util/exception.h"
#include "util/math_utils.h"

namespace cadenza {

float clamp_sensitivity(float sensitivity) {
  return clamp(sensitivity, kMinSensitivity, kMaxSensitivity);
}

void PipelineConfig::validate() const {
  CADENZA_CHECK_MSG(is_positive_finite(sensitivity), ErrorCode::InvalidParameter,
                    "sensitivity must be positive");
  CADENZA_CHECK_MSG(skip_bins >= 0, ErrorCode::InvalidParameter, "skip_bins must be >= 0");
  CADENZA_CHECK_MSG(activity_threshold >= 0.0f, ErrorCode::InvalidParameter,
                    "activity_threshold must be >= 0");
  CADENZA_CHECK_MSG(decay_factor >= 0.0f && decay_factor <= 1.0f, ErrorCode::InvalidParameter,
                    "decay_factor must be in [0, 1]");
  CADENZA_CHECK_MSG(low_cut >= 0, ErrorCode::InvalidParameter, "low_cut must be >= 0");
  CADENZA_CHECK_MSG(high_cut >= low_cut, ErrorCode::InvalidParameter,
                    "high_cut must be >= low_cut");
  CADENZA_CHECK_MSG(is_positive_finite(tuning_ref_hz), ErrorCode::InvalidParameter,
                    "tuning_ref_hz must be positive");
  CADENZA_CHECK_MSG(music_threshold >= 0.0f, ErrorCode::InvalidParameter,
                    "music_threshold must be >= 0");
}

}  // namespace cadenza
