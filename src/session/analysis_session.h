#pragma once

/// @file analysis_session.h
/// @brief Playback-driven orchestration of the spectrum -> bands -> peaks -> tempo -> beat
///        pipeline.

#include <memory>
#include <string>
#include <vector>

#include "analysis/band_analyzer.h"
#include "analysis/beat_grid.h"
#include "analysis/peak_detector.h"
#include "analysis/tempo_estimator.h"
#include "sampler/spectrum_sampler.h"
#include "session/analysis_frame.h"
#include "session/session_config.h"
#include "util/exception.h"
#include "util/types.h"

namespace cadence {

/// @brief Owns the analysis state for one playback session.
/// @details Lifecycle:
///          - Idle -> Playing via start();
///          - Playing <-> Paused via pause() / resume();
///          - any active phase -> Idle via stop();
///          - switch_source() replaces the sampler without changing the phase.
///
///          The host drives the session by calling advance() once per render tick with a
///          monotonic, strictly positive timestamp in seconds. A tick never throws for source
///          problems: if the sampler cannot deliver data the previous frame is returned with
///          on_beat cleared and status set, and acquisition is retried on the next tick.
///
/// @code
/// cadence::PcmSamplerProvider provider;
/// provider.add_source("track", &source);
/// cadence::AnalysisSession session(provider);
/// session.start("track");
/// auto frame = session.advance(1.0 / 30.0);
/// @endcode
class AnalysisSession {
 public:
  /// @param provider Opens samplers by source id; must outlive the session
  /// @param config Session tuning
  /// @throws CadenceException(InvalidConfiguration) if config is invalid
  explicit AnalysisSession(SamplerProvider& provider,
                           const SessionConfig& config = SessionConfig());

  ~AnalysisSession();

  // Non-copyable, movable
  AnalysisSession(const AnalysisSession&) = delete;
  AnalysisSession& operator=(const AnalysisSession&) = delete;
  AnalysisSession(AnalysisSession&&);
  AnalysisSession& operator=(AnalysisSession&&);

  /// @brief Begins analysing a source. Peak, tempo and beat state start fresh.
  /// @param source_id Source to open
  /// @param preserve_tempo Keep the current BPM instead of falling back to the default; the
  ///        beat interval is re-derived from the rounded BPM
  /// @throws CadenceException(InvalidParameter) if the provider does not know source_id
  /// @note Calling start() on an active session behaves like switch_source().
  void start(const std::string& source_id, bool preserve_tempo = false);

  /// @brief Suspends analysis. Ticks return the held frame until resume().
  void pause();

  /// @brief Resumes analysis. The tempo is kept; peak history and beat alignment restart so
  ///        the first tick after resuming declares a beat.
  void resume();

  /// @brief Replaces the active source, resetting peak, tempo and beat state.
  /// @throws CadenceException(InvalidParameter) if the provider does not know source_id;
  ///         the current source stays active in that case
  void switch_source(const std::string& source_id, bool preserve_tempo = false);

  /// @brief Releases the sampler and returns to Idle. The tempo is retained so a later
  ///        start(..., true) can continue from it.
  void stop();

  /// @brief Runs one tick of the pipeline.
  /// @param now Tick time in seconds (monotonic, > 0)
  /// @return The frame for this tick
  AnalysisFrame advance(double now);

  PlaybackPhase phase() const { return phase_; }
  bool active() const { return phase_ != PlaybackPhase::Idle; }
  const std::string& source_id() const { return source_id_; }

  /// @brief Current tempo estimate.
  const TempoState& tempo() const { return tempo_; }

  /// @brief Recent peak timestamps.
  const PeakWindow& peak_window() const { return peak_detector_.window(); }

  /// @brief Beat grid anchor (0 if unaligned).
  double last_beat_time() const { return beat_grid_.last_beat_time(); }

  /// @brief Interval histogram from the most recent tempo estimate.
  const std::vector<IntervalBin>& interval_histogram() const {
    return tempo_estimator_.last_histogram();
  }

  /// @brief Last frame produced from fresh data.
  const AnalysisFrame& last_frame() const { return last_frame_; }

  const SessionConfig& config() const { return config_; }

  /// @brief Active sampler, or nullptr while Idle or while acquisition is pending.
  const SpectrumSampler* sampler() const { return sampler_.get(); }

 private:
  void open_source(const std::string& source_id);
  void release_sampler();
  void reset_analysis(bool preserve_tempo);
  AnalysisFrame held_frame() const;
  AnalysisFrame sampler_failed(const CadenceException& e);

  SamplerProvider* provider_;
  SessionConfig config_;
  BandAnalyzer band_analyzer_;
  PeakDetector peak_detector_;
  TempoEstimator tempo_estimator_;
  BeatGrid beat_grid_;
  TempoState tempo_;

  PlaybackPhase phase_ = PlaybackPhase::Idle;
  std::string source_id_;
  std::unique_ptr<SpectrumSampler> sampler_;
  AnalysisFrame last_frame_;
  double beat_time_ = 0.0;
  bool outage_ = false;
};

}  // namespace cadence
