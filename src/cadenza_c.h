#pragma once

/// @file cadenza_c.h
/// @brief C API for libcadenza.
/// @details Provides a C-compatible interface for hosts that drive the
///          pipeline from a C audio callback.

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Error codes
typedef enum {
  CADENZA_OK = 0,
  CADENZA_ERROR_FILE_NOT_FOUND = 1,
  CADENZA_ERROR_INVALID_FORMAT = 2,
  CADENZA_ERROR_DECODE_FAILED = 3,
  CADENZA_ERROR_INVALID_PARAMETER = 4,
  CADENZA_ERROR_OUT_OF_MEMORY = 5,
  CADENZA_ERROR_UNKNOWN = 99
} CadenzaError;

// Activity enum
typedef enum {
  CADENZA_ACTIVITY_STOPPED = 0,
  CADENZA_ACTIVITY_LISTENING = 1,
  CADENZA_ACTIVITY_HEARING_MUSIC = 2
} CadenzaActivity;

// Opaque types
typedef struct CadenzaPipeline CadenzaPipeline;
typedef struct CadenzaReference CadenzaReference;

// Pipeline configuration (fill with cadenza_config_default)
typedef struct {
  float sensitivity;
  int skip_bins;
  float activity_threshold;
  float decay_factor;
  int low_cut;
  int high_cut;
  float tuning_ref_hz;
  float music_threshold;
} CadenzaConfig;

// Per-frame output
typedef struct {
  int frame_index;
  float loudness;
  float raw_loudness;
  float chroma[12];
  int active;
  CadenzaActivity activity;
} CadenzaSnapshot;

// Configuration
void cadenza_config_default(CadenzaConfig* out);

// Pipeline functions
CadenzaError cadenza_pipeline_create(const CadenzaConfig* config, float sample_rate, size_t n_bins,
                                     CadenzaPipeline** out);
void cadenza_pipeline_free(CadenzaPipeline* pipeline);
CadenzaError cadenza_pipeline_process(CadenzaPipeline* pipeline, const float* magnitudes,
                                      size_t n_bins, CadenzaSnapshot* out);
CadenzaError cadenza_pipeline_set_sensitivity(CadenzaPipeline* pipeline, float sensitivity);
float cadenza_pipeline_sensitivity(const CadenzaPipeline* pipeline);
CadenzaError cadenza_pipeline_snapshot(const CadenzaPipeline* pipeline, CadenzaSnapshot* out);
void cadenza_pipeline_stop(CadenzaPipeline* pipeline);

// Stateless loudness estimate
CadenzaError cadenza_estimate_loudness(const float* magnitudes, size_t n_bins, float sensitivity,
                                       int skip_bins, float* out_level, float* out_raw);

// Reference sequences
CadenzaError cadenza_reference_load(const char* path, CadenzaReference** out);
CadenzaError cadenza_reference_parse(const char* json, CadenzaReference** out);
void cadenza_reference_free(CadenzaReference* reference);
size_t cadenza_reference_size(const CadenzaReference* reference);
CadenzaError cadenza_reference_frame(const CadenzaReference* reference, size_t index,
                                     float out_chroma[12]);

// Error handling
const char* cadenza_error_message(CadenzaError error);

// Version
const char* cadenza_version(void);

#ifdef __cplusplus
}
#endif
