#pragma once

/// @file analysis_frame.h
/// @brief Per-tick output of an analysis session.

#include <cstdint>

#include "analysis/band_analyzer.h"
#include "util/types.h"

namespace cadence {

/// @brief Result of one AnalysisSession::advance() call.
/// @details Visual collaborators treat the frame as read-only. When no fresh spectrum
///          could be read, the previous frame is returned with on_beat cleared and status
///          describing why.
struct AnalysisFrame {
  FrequencyBands bands;            ///< Bass/mid/high energy in [0, 1]
  float amplitude = 0.0f;          ///< Overall level in [0, 1]
  bool on_beat = false;            ///< True on ticks that fall on the beat grid
  uint32_t bpm = 120;              ///< Current tempo estimate
  double beat_time = 0.0;          ///< Time of the last declared beat (0 = none yet)
  double timestamp = 0.0;          ///< Tick time the data was sampled at
  Spectrum spectrum;               ///< Raw byte spectrum for visualizers
  ErrorCode status = ErrorCode::Ok;  ///< Ok, or why this tick produced no fresh data
};

}  // namespace cadence
