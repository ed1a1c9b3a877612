#pragma once

/// @file pitchtrack.h
/// @brief Main header for libpitchtrack - real-time monophonic pitch detection.
/// @details Include this file to access all libpitchtrack functionality.

// Version information
#define PITCHTRACK_VERSION_MAJOR 1
#define PITCHTRACK_VERSION_MINOR 0
#define PITCHTRACK_VERSION_PATCH 0
#define PITCHTRACK_VERSION_STRING "1.0.0"

// Utility
#include "util/exception.h"
#include "util/math_utils.h"
#include "util/types.h"

// Core
#include "core/audio.h"
#include "core/audio_io.h"
#include "core/convert.h"
#include "core/ring_accumulator.h"

// Features
#include "feature/notation.h"
#include "feature/note.h"
#include "feature/yin_estimator.h"

// Streaming
#include "streaming/detection_config.h"
#include "streaming/live_session.h"
#include "streaming/pitch_estimate.h"
#include "streaming/signal_conditioner.h"

// Analysis
#include "analysis/roadmap_analyzer.h"

// Quick API
#include "quick.h"

namespace pitchtrack {

/// @brief Returns the library version string.
/// @return Version string (e.g., "1.0.0")
inline const char* version() { return PITCHTRACK_VERSION_STRING; }

/// @brief Returns the major version number.
inline int version_major() { return PITCHTRACK_VERSION_MAJOR; }

/// @brief Returns the minor version number.
inline int version_minor() { return PITCHTRACK_VERSION_MINOR; }

/// @brief Returns the patch version number.
inline int version_patch() { return PITCHTRACK_VERSION_PATCH; }

}  // namespace pitchtrack
