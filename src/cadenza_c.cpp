/// @file cadenza_c.cpp
/// @brief Implementation of C API.

#include "cadenza_c.h"

#include <algorithm>
#include <memory>
#include <new>

#include "cadenza.h"
#include "feature/loudness.h"
#include "reference/reference_sequence.h"
#include "streaming/chroma_pipeline.h"
#include "util/exception.h"

using namespace cadenza;

// Internal wrapper structures
struct CadenzaPipeline {
  std::unique_ptr<ChromaPipeline> pipeline;
};

struct CadenzaReference {
  ReferenceSequence sequence;
};

namespace {

/// @brief Minimum valid sample rate (8kHz - telephone quality)
constexpr float kMinSampleRate = 8000.0f;
/// @brief Maximum valid sample rate (384kHz - high-res audio)
constexpr float kMaxSampleRate = 384000.0f;

CadenzaError to_c_error(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return CADENZA_OK;
    case ErrorCode::FileNotFound:
      return CADENZA_ERROR_FILE_NOT_FOUND;
    case ErrorCode::InvalidFormat:
      return CADENZA_ERROR_INVALID_FORMAT;
    case ErrorCode::DecodeFailed:
      return CADENZA_ERROR_DECODE_FAILED;
    case ErrorCode::InvalidParameter:
      return CADENZA_ERROR_INVALID_PARAMETER;
    case ErrorCode::OutOfMemory:
      return CADENZA_ERROR_OUT_OF_MEMORY;
    default:
      return CADENZA_ERROR_UNKNOWN;
  }
}

/// @brief Runs fn, translating exceptions into error codes at the C boundary.
template <typename Fn>
CadenzaError guarded(Fn&& fn) {
  try {
    fn();
    return CADENZA_OK;
  } catch (const CadenzaException& e) {
    return to_c_error(e.code());
  } catch (const std::bad_alloc&) {
    return CADENZA_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception&) {
    return CADENZA_ERROR_UNKNOWN;
  }
}

PipelineConfig from_c_config(const CadenzaConfig& c) {
  PipelineConfig config;
  config.sensitivity = c.sensitivity;
  config.skip_bins = c.skip_bins;
  config.activity_threshold = c.activity_threshold;
  config.decay_factor = c.decay_factor;
  config.low_cut = c.low_cut;
  config.high_cut = c.high_cut;
  config.tuning_ref_hz = c.tuning_ref_hz;
  config.music_threshold = c.music_threshold;
  return config;
}

void to_c_snapshot(const ChromaSnapshot& snapshot, CadenzaSnapshot* out) {
  out->frame_index = snapshot.frame_index;
  out->loudness = snapshot.loudness;
  out->raw_loudness = snapshot.raw_loudness;
  std::copy(snapshot.chroma.begin(), snapshot.chroma.end(), out->chroma);
  out->active = snapshot.active ? 1 : 0;
  out->activity = static_cast<CadenzaActivity>(static_cast<int>(snapshot.activity));
}

}  // namespace

// Configuration

void cadenza_config_default(CadenzaConfig* out) {
  if (out == nullptr) {
    return;
  }
  PipelineConfig config;
  out->sensitivity = config.sensitivity;
  out->skip_bins = config.skip_bins;
  out->activity_threshold = config.activity_threshold;
  out->decay_factor = config.decay_factor;
  out->low_cut = config.low_cut;
  out->high_cut = config.high_cut;
  out->tuning_ref_hz = config.tuning_ref_hz;
  out->music_threshold = config.music_threshold;
}

// Pipeline functions

CadenzaError cadenza_pipeline_create(const CadenzaConfig* config, float sample_rate, size_t n_bins,
                                     CadenzaPipeline** out) {
  if (out == nullptr) {
    return CADENZA_ERROR_INVALID_PARAMETER;
  }
  if (!(sample_rate >= kMinSampleRate && sample_rate <= kMaxSampleRate)) {
    return CADENZA_ERROR_INVALID_PARAMETER;
  }

  PipelineConfig cpp_config = config ? from_c_config(*config) : PipelineConfig();
  return guarded([&] {
    auto handle = std::make_unique<CadenzaPipeline>();
    handle->pipeline = std::make_unique<ChromaPipeline>(cpp_config, sample_rate, n_bins);
    *out = handle.release();
  });
}

void cadenza_pipeline_free(CadenzaPipeline* pipeline) { delete pipeline; }

CadenzaError cadenza_pipeline_process(CadenzaPipeline* pipeline, const float* magnitudes,
                                      size_t n_bins, CadenzaSnapshot* out) {
  if (pipeline == nullptr || magnitudes == nullptr || n_bins == 0) {
    return CADENZA_ERROR_INVALID_PARAMETER;
  }

  return guarded([&] {
    ChromaSnapshot snapshot = pipeline->pipeline->process(magnitudes, n_bins);
    if (out != nullptr) {
      to_c_snapshot(snapshot, out);
    }
  });
}

CadenzaError cadenza_pipeline_set_sensitivity(CadenzaPipeline* pipeline, float sensitivity) {
  if (pipeline == nullptr) {
    return CADENZA_ERROR_INVALID_PARAMETER;
  }
  return guarded([&] { pipeline->pipeline->set_sensitivity(sensitivity); });
}

float cadenza_pipeline_sensitivity(const CadenzaPipeline* pipeline) {
  if (pipeline == nullptr) {
    return 0.0f;
  }
  return pipeline->pipeline->sensitivity();
}

CadenzaError cadenza_pipeline_snapshot(const CadenzaPipeline* pipeline, CadenzaSnapshot* out) {
  if (pipeline == nullptr || out == nullptr) {
    return CADENZA_ERROR_INVALID_PARAMETER;
  }
  to_c_snapshot(*pipeline->pipeline->snapshot(), out);
  return CADENZA_OK;
}

void cadenza_pipeline_stop(CadenzaPipeline* pipeline) {
  if (pipeline == nullptr) {
    return;
  }
  pipeline->pipeline->stop();
}

// Stateless loudness estimate

CadenzaError cadenza_estimate_loudness(const float* magnitudes, size_t n_bins, float sensitivity,
                                       int skip_bins, float* out_level, float* out_raw) {
  if (magnitudes == nullptr && n_bins > 0) {
    return CADENZA_ERROR_INVALID_PARAMETER;
  }
  if (out_level == nullptr) {
    return CADENZA_ERROR_INVALID_PARAMETER;
  }

  return guarded([&] {
    LoudnessResult result =
        estimate_loudness(MagnitudeFrame(magnitudes, n_bins), sensitivity, skip_bins);
    *out_level = result.level;
    if (out_raw != nullptr) {
      *out_raw = result.raw;
    }
  });
}

// Reference sequences

CadenzaError cadenza_reference_load(const char* path, CadenzaReference** out) {
  if (path == nullptr || out == nullptr) {
    return CADENZA_ERROR_INVALID_PARAMETER;
  }
  return guarded([&] { *out = new CadenzaReference{ReferenceSequence::load(path)}; });
}

CadenzaError cadenza_reference_parse(const char* json, CadenzaReference** out) {
  if (json == nullptr || out == nullptr) {
    return CADENZA_ERROR_INVALID_PARAMETER;
  }
  return guarded([&] { *out = new CadenzaReference{ReferenceSequence::parse(json)}; });
}

void cadenza_reference_free(CadenzaReference* reference) { delete reference; }

size_t cadenza_reference_size(const CadenzaReference* reference) {
  if (reference == nullptr) {
    return 0;
  }
  return reference->sequence.size();
}

CadenzaError cadenza_reference_frame(const CadenzaReference* reference, size_t index,
                                     float out_chroma[12]) {
  if (reference == nullptr || out_chroma == nullptr) {
    return CADENZA_ERROR_INVALID_PARAMETER;
  }
  return guarded([&] {
    const ChromaVector& frame = reference->sequence.frame(index);
    std::copy(frame.begin(), frame.end(), out_chroma);
  });
}

// Error handling

const char* cadenza_error_message(CadenzaError error) {
  switch (error) {
    case CADENZA_OK:
      return "OK";
    case CADENZA_ERROR_FILE_NOT_FOUND:
      return "File not found";
    case CADENZA_ERROR_INVALID_FORMAT:
      return "Invalid format";
    case CADENZA_ERROR_DECODE_FAILED:
      return "Decode failed";
    case CADENZA_ERROR_INVALID_PARAMETER:
      return "Invalid parameter";
    case CADENZA_ERROR_OUT_OF_MEMORY:
      return "Out of memory";
    default:
      return "Unknown error";
  }
}

// Version

const char* cadenza_version(void) { return CADENZA_VERSION_STRING; }
