#include "analysis/peak_detector.h"

#include <cmath>

#include "util/exception.h"
#include "util/log.h"

namespace cadence {

void PeakConfig::validate() const {
  CADENCE_CHECK_MSG(std::isfinite(threshold) && threshold > 0.0f,
                    ErrorCode::InvalidConfiguration, "peak threshold must be positive");
  CADENCE_CHECK_MSG(std::isfinite(rise_ratio) && rise_ratio > 0.0f,
                    ErrorCode::InvalidConfiguration, "peak rise_ratio must be positive");
  CADENCE_CHECK_MSG(std::isfinite(min_peak_distance) && min_peak_distance > 0.0,
                    ErrorCode::InvalidConfiguration, "min_peak_distance must be positive");
  CADENCE_CHECK_MSG(std::isfinite(window_seconds) && window_seconds > 0.0,
                    ErrorCode::InvalidConfiguration, "peak window_seconds must be positive");
}

void PeakWindow::insert(double timestamp) {
  peaks_.push_back(timestamp);
  const double horizon = timestamp - window_seconds_;
  while (!peaks_.empty() && peaks_.front() < horizon) {
    peaks_.pop_front();
  }
}

PeakDetector::PeakDetector(const PeakConfig& config)
    : config_(config), window_(config.window_seconds) {
  config_.validate();
}

bool PeakDetector::detect(float bass_energy, double now) {
  const bool is_peak = previous_energy_ > 0.0f && bass_energy > config_.threshold &&
                       bass_energy > previous_energy_ * config_.rise_ratio &&
                       now - last_peak_time_ > config_.min_peak_distance;

  if (is_peak) {
    window_.insert(now);
    last_peak_time_ = now;
    logger()->trace("peak at {:.3f}s (bass {:.3f}, window {})", now, bass_energy,
                    window_.size());
  }

  previous_energy_ = bass_energy;
  return is_peak;
}

void PeakDetector::reset() {
  window_.clear();
  previous_energy_ = 0.0f;
  last_peak_time_ = 0.0;
}

}  // namespace cadence
