#pragma once

/// @file cadenza.h
/// @brief Main header for libcadenza - real-time loudness and chroma extraction.
/// @details Include this file to access all libcadenza functionality.

// Version information
#define CADENZA_VERSION_MAJOR 1
#define CADENZA_VERSION_MINOR 0
#define CADENZA_VERSION_PATCH 0
#define CADENZA_VERSION_STRING "1.0.0"

// Utility
#include "util/exception.h"
#include "util/math_utils.h"
#include "util/types.h"

// Core
#include "core/audio_io.h"
#include "core/convert.h"
#include "core/fft.h"
#include "core/spectrum_tap.h"
#include "core/window.h"

// Features
#include "feature/chroma_reducer.h"
#include "feature/loudness.h"
#include "feature/pitch_class_map.h"

// Streaming
#include "streaming/chroma_pipeline.h"
#include "streaming/chroma_snapshot.h"
#include "streaming/chroma_stream.h"
#include "streaming/pipeline_config.h"
#include "streaming/snapshot_publisher.h"
#include "streaming/stream_config.h"
#include "streaming/stream_frame.h"

// Reference data
#include "reference/reference_sequence.h"

namespace cadenza {

/// @brief Returns the library version string.
/// @return Version string (e.g., "1.0.0")
inline const char* version() { return CADENZA_VERSION_STRING; }

/// @brief Returns the major version number.
inline int version_major() { return CADENZA_VERSION_MAJOR; }

/// @brief Returns the minor version number.
inline int version_minor() { return CADENZA_VERSION_MINOR; }

/// @brief Returns the patch version number.
inline int version_patch() { return CADENZA_VERSION_PATCH; }

}  // namespace cadenza
