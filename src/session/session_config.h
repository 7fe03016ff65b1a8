#pragma once

/// @file session_config.h
/// @brief Configuration for AnalysisSession.

#include "analysis/band_analyzer.h"
#include "analysis/beat_grid.h"
#include "analysis/peak_detector.h"
#include "analysis/tempo_estimator.h"
#include "core/analyser.h"

namespace cadence {

/// @brief Complete session configuration, fixed for the lifetime of a session.
/// @details Defaults are tuned for dance-music bass lines: 128-point FFT with
///          smoothing 0.5, bass = first 10% of bins, threshold 0.65 with a 1.2x rise and a
///          0.2 s refractory period, 5 s peak window, 0.05 s beat tolerance, 120 BPM default.
struct SessionConfig {
  AnalyserConfig analyser;
  BandConfig bands;
  PeakConfig peaks;
  TempoConfig tempo;
  BeatGridConfig beat_grid;

  /// @brief Validates every section.
  /// @throws CadenceException(InvalidConfiguration) describing the first invalid field
  void validate() const {
    analyser.validate();
    bands.validate();
    peaks.validate();
    tempo.validate();
    beat_grid.validate();
  }
};

}  // namespace cadence
