#include "analysis/tempo_estimator.h"

#include <algorithm>
#include <cmath>
#include <map>

#include "util/exception.h"
#include "util/log.h"

namespace cadence {

void TempoConfig::validate() const {
  CADENCE_CHECK_MSG(min_peaks >= 2, ErrorCode::InvalidConfiguration,
                    "min_peaks must be at least 2");
  CADENCE_CHECK_MSG(std::isfinite(bucket_seconds) && bucket_seconds > 0.0,
                    ErrorCode::InvalidConfiguration, "bucket_seconds must be positive");
  CADENCE_CHECK_MSG(std::isfinite(dominance_ratio) && dominance_ratio > 0.0,
                    ErrorCode::InvalidConfiguration, "dominance_ratio must be positive");
  CADENCE_CHECK_MSG(std::isfinite(bpm_min) && std::isfinite(bpm_max) && bpm_min > 0.0 &&
                        bpm_max >= 2.0 * bpm_min,
                    ErrorCode::InvalidConfiguration,
                    "tempo range must be positive and span at least one octave");
  CADENCE_CHECK_MSG(default_bpm >= bpm_min && default_bpm <= bpm_max,
                    ErrorCode::InvalidConfiguration, "default_bpm must lie in the tempo range");
}

std::vector<IntervalBin> build_interval_histogram(const std::deque<double>& peaks,
                                                  double bucket_seconds) {
  if (peaks.size() < 2 || bucket_seconds <= 0.0) {
    return {};
  }

  std::map<long, int> counts;
  for (size_t i = 1; i < peaks.size(); ++i) {
    double interval = peaks[i] - peaks[i - 1];
    ++counts[std::lround(interval / bucket_seconds)];
  }

  std::vector<IntervalBin> bins;
  bins.reserve(counts.size());
  for (const auto& [bucket, count] : counts) {
    bins.push_back({static_cast<double>(bucket) * bucket_seconds, count});
  }

  std::stable_sort(bins.begin(), bins.end(),
                   [](const IntervalBin& a, const IntervalBin& b) { return a.count > b.count; });
  return bins;
}

double fold_bpm(double bpm, double bpm_min, double bpm_max) {
  if (!std::isfinite(bpm) || bpm <= 0.0) {
    return 0.0;
  }
  while (bpm < bpm_min) bpm *= 2.0;
  while (bpm > bpm_max) bpm /= 2.0;
  return bpm;
}

TempoEstimator::TempoEstimator(const TempoConfig& config) : config_(config) {
  config_.validate();
}

std::optional<TempoState> TempoEstimator::estimate(const PeakWindow& window) {
  if (window.size() < static_cast<size_t>(config_.min_peaks)) {
    return std::nullopt;
  }

  histogram_ = build_interval_histogram(window.peaks(), config_.bucket_seconds);
  if (histogram_.empty()) {
    return std::nullopt;
  }

  const bool dominant = histogram_.size() == 1 ||
                        histogram_[0].count > histogram_[1].count * config_.dominance_ratio;
  if (!dominant) {
    logger()->trace("ambiguous tempo: {} x {:.2f}s vs {} x {:.2f}s", histogram_[0].count,
                    histogram_[0].interval, histogram_[1].count, histogram_[1].interval);
    return std::nullopt;
  }

  const double interval = histogram_[0].interval;
  if (!(interval > 0.0)) {
    return std::nullopt;
  }

  const double bpm = fold_bpm(60.0 / interval, config_.bpm_min, config_.bpm_max);
  if (bpm <= 0.0) {
    return std::nullopt;
  }

  TempoState tempo;
  tempo.bpm = static_cast<uint32_t>(std::lround(bpm));
  tempo.beat_interval = 60.0 / bpm;
  return tempo;
}

}  // namespace cadence
