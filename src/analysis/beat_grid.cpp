#include "analysis/beat_grid.h"

#include <cmath>

#include "util/exception.h"
#include "util/log.h"

namespace cadence {

void BeatGridConfig::validate() const {
  CADENCE_CHECK_MSG(std::isfinite(tolerance) && tolerance > 0.0, ErrorCode::InvalidConfiguration,
                    "beat tolerance must be positive");
}

BeatGrid::BeatGrid(const BeatGridConfig& config) : config_(config) { config_.validate(); }

bool BeatGrid::on_schedule(double elapsed, double interval) const {
  return elapsed >= interval - config_.tolerance && elapsed <= interval + config_.tolerance;
}

bool BeatGrid::check(double now, const TempoState& tempo) {
  const double interval = tempo.beat_interval;
  if (!(interval > 0.0)) {
    return false;
  }

  if (last_beat_time_ == 0.0) {
    last_beat_time_ = now;
    return true;
  }

  const double elapsed = now - last_beat_time_;
  if (on_schedule(elapsed, interval)) {
    last_beat_time_ = now;
    return true;
  }

  if (elapsed > 2.0 * interval) {
    const double missed = std::floor(elapsed / interval);
    last_beat_time_ = now - (elapsed - missed * interval);
    logger()->trace("beat grid re-anchored at {:.3f}s after {:.0f} missed beats",
                    last_beat_time_, missed);

    if (on_schedule(now - last_beat_time_, interval)) {
      last_beat_time_ = now;
      return true;
    }
  }

  return false;
}

}  // namespace cadence
