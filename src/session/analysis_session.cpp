#include "session/analysis_session.h"

#include <utility>

#include "util/log.h"

namespace cadence {

namespace {

const SessionConfig& validated(const SessionConfig& config) {
  config.validate();
  return config;
}

}  // namespace

AnalysisSession::AnalysisSession(SamplerProvider& provider, const SessionConfig& config)
    : provider_(&provider),
      config_(validated(config)),
      band_analyzer_(config_.bands),
      peak_detector_(config_.peaks),
      tempo_estimator_(config_.tempo),
      beat_grid_(config_.beat_grid),
      tempo_(config_.tempo.default_tempo()) {
  last_frame_.bpm = tempo_.bpm;
}

AnalysisSession::~AnalysisSession() { release_sampler(); }

AnalysisSession::AnalysisSession(AnalysisSession&&) = default;
AnalysisSession& AnalysisSession::operator=(AnalysisSession&&) = default;

void AnalysisSession::start(const std::string& source_id, bool preserve_tempo) {
  if (phase_ != PlaybackPhase::Idle) {
    switch_source(source_id, preserve_tempo);
    return;
  }

  open_source(source_id);
  reset_analysis(preserve_tempo);
  phase_ = PlaybackPhase::Playing;
  logger()->info("session started on '{}' at {} BPM", source_id_, tempo_.bpm);
}

void AnalysisSession::pause() {
  if (phase_ != PlaybackPhase::Playing) {
    logger()->debug("pause ignored while {}", phase_name(phase_));
    return;
  }
  phase_ = PlaybackPhase::Paused;
  logger()->info("session paused");
}

void AnalysisSession::resume() {
  if (phase_ != PlaybackPhase::Paused) {
    logger()->debug("resume ignored while {}", phase_name(phase_));
    return;
  }
  reset_analysis(true);
  phase_ = PlaybackPhase::Playing;
  logger()->info("session resumed at {} BPM", tempo_.bpm);
}

void AnalysisSession::switch_source(const std::string& source_id, bool preserve_tempo) {
  if (phase_ == PlaybackPhase::Idle) {
    start(source_id, preserve_tempo);
    return;
  }

  const std::string previous = source_id_;
  open_source(source_id);
  reset_analysis(preserve_tempo);
  logger()->info("switched source '{}' -> '{}' ({})", previous, source_id_, phase_name(phase_));
}

void AnalysisSession::stop() {
  if (phase_ == PlaybackPhase::Idle) {
    return;
  }
  release_sampler();
  phase_ = PlaybackPhase::Idle;
  logger()->info("session stopped on '{}'", source_id_);
  source_id_.clear();
  outage_ = false;
}

AnalysisFrame AnalysisSession::advance(double now) {
  if (phase_ != PlaybackPhase::Playing) {
    return held_frame();
  }

  Spectrum spectrum;
  try {
    if (!sampler_) {
      sampler_ = provider_->open(source_id_, config_.analyser);
    }
    spectrum = sampler_->sample();
  } catch (const CadenceException& e) {
    return sampler_failed(e);
  }

  if (outage_) {
    logger()->info("source '{}' available again", source_id_);
    outage_ = false;
  }

  AnalysisFrame frame;
  frame.bands = band_analyzer_.analyze(spectrum);
  frame.amplitude = band_analyzer_.amplitude(spectrum);

  if (peak_detector_.detect(frame.bands.bass, now)) {
    if (auto estimate = tempo_estimator_.estimate(peak_detector_.window())) {
      if (estimate->bpm != tempo_.bpm) {
        logger()->debug("tempo locked at {} BPM ({:.3f}s interval, {} peaks)", estimate->bpm,
                        estimate->beat_interval, peak_detector_.window().size());
      }
      tempo_ = *estimate;
    }
  }

  frame.on_beat = beat_grid_.check(now, tempo_);
  if (frame.on_beat) {
    beat_time_ = now;
  }

  frame.bpm = tempo_.bpm;
  frame.beat_time = beat_time_;
  frame.timestamp = now;
  frame.spectrum = std::move(spectrum);
  last_frame_ = frame;
  return frame;
}

void AnalysisSession::open_source(const std::string& source_id) {
  std::unique_ptr<SpectrumSampler> sampler;
  try {
    sampler = provider_->open(source_id, config_.analyser);
  } catch (const CadenceException& e) {
    if (!e.recoverable()) {
      throw;
    }
    logger()->warn("source '{}' not ready, will retry: {}", source_id, e.what());
  }

  release_sampler();
  sampler_ = std::move(sampler);
  source_id_ = source_id;
  outage_ = sampler_ == nullptr;
}

void AnalysisSession::release_sampler() { sampler_.reset(); }

void AnalysisSession::reset_analysis(bool preserve_tempo) {
  peak_detector_.reset();
  tempo_estimator_.reset();
  beat_grid_.reset();
  beat_time_ = 0.0;
  if (!preserve_tempo) {
    tempo_ = config_.tempo.default_tempo();
  } else if (tempo_.bpm > 0) {
    // The grid restarts on the reported BPM, not the unrounded estimate
    tempo_.beat_interval = 60.0 / tempo_.bpm;
  }

  last_frame_ = AnalysisFrame();
  last_frame_.bpm = tempo_.bpm;
}

AnalysisFrame AnalysisSession::held_frame() const {
  AnalysisFrame frame = last_frame_;
  frame.on_beat = false;
  return frame;
}

AnalysisFrame AnalysisSession::sampler_failed(const CadenceException& e) {
  if (e.recoverable()) {
    if (!outage_) {
      logger()->warn("source '{}' unavailable: {}", source_id_, e.what());
    }
  } else {
    if (!outage_) {
      logger()->error("sampler for '{}' failed: {}", source_id_, e.what());
    }
    release_sampler();
  }
  outage_ = true;

  AnalysisFrame frame = held_frame();
  frame.status = e.code();
  return frame;
}

}  // namespace cadence
