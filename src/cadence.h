#pragma once

/// @file cadence.h
/// @brief Main header for libcadence - real-time audio analysis and beat sync.
/// @details Include this file to access all libcadence functionality.

// Version information
#define CADENCE_VERSION_MAJOR 1
#define CADENCE_VERSION_MINOR 0
#define CADENCE_VERSION_PATCH 0
#define CADENCE_VERSION_STRING "1.0.0"

// Utility
#include "util/exception.h"
#include "util/log.h"
#include "util/types.h"

// Core
#include "core/analyser.h"
#include "core/audio_io.h"
#include "core/fft.h"
#include "core/pcm_source.h"
#include "core/window.h"

// Sampling
#include "sampler/analyser_sampler.h"
#include "sampler/spectrum_sampler.h"

// Analysis
#include "analysis/band_analyzer.h"
#include "analysis/beat_grid.h"
#include "analysis/peak_detector.h"
#include "analysis/tempo_estimator.h"

// Session
#include "session/analysis_frame.h"
#include "session/analysis_session.h"
#include "session/session_config.h"

namespace cadence {

/// @brief Returns the library version string.
/// @return Version string (e.g., "1.0.0")
inline const char* version() { return CADENCE_VERSION_STRING; }

/// @brief Returns the major version number.
inline int version_major() { return CADENCE_VERSION_MAJOR; }

/// @brief Returns the minor version number.
inline int version_minor() { return CADENCE_VERSION_MINOR; }

/// @brief Returns the patch version number.
inline int version_patch() { return CADENCE_VERSION_PATCH; }

}  // namespace cadence
