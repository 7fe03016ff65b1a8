#pragma once

/// @file beat_grid.h
/// @brief Predictive beat grid that phase-locks to a tempo estimate.

#include "analysis/tempo_estimator.h"

namespace cadence {

/// @brief Configuration for BeatGrid.
struct BeatGridConfig {
  double tolerance = 0.05;  ///< Allowed timing slack around each expected beat (seconds)

  /// @throws CadenceException(InvalidConfiguration) if tolerance is not positive
  void validate() const;
};

/// @brief Decides per tick whether "now" falls on the beat grid.
/// @details Evaluated in order:
///          - unaligned (last beat time 0): declare a beat and anchor the grid at now;
///          - on schedule (now - last beat within interval +/- tolerance): beat, re-anchor;
///          - large gap (more than two intervals, e.g. after a pause or seek): shift the
///            anchor forward by the whole number of missed intervals so the remaining phase
///            is kept, then beat only if that phase falls in tolerance.
///          Re-anchoring on every beat avoids the drift of modulo arithmetic.
class BeatGrid {
 public:
  /// @throws CadenceException(InvalidConfiguration) if config is invalid
  explicit BeatGrid(const BeatGridConfig& config = BeatGridConfig());

  /// @brief Checks whether the current tick is a beat.
  /// @param now Tick time in seconds (must be positive: 0 is the unaligned sentinel)
  /// @param tempo Current tempo estimate
  /// @return True if a beat is declared for this tick
  bool check(double now, const TempoState& tempo);

  /// @brief Returns to the unaligned state; the next check() declares a beat.
  void reset() { last_beat_time_ = 0.0; }

  /// @brief True once the grid has been anchored.
  bool aligned() const { return last_beat_time_ != 0.0; }

  /// @brief Time of the last declared beat or re-anchor point (0 if unaligned).
  double last_beat_time() const { return last_beat_time_; }

  double tolerance() const { return config_.tolerance; }

 private:
  bool on_schedule(double elapsed, double interval) const;

  BeatGridConfig config_;
  double last_beat_time_ = 0.0;
};

}  // namespace cadence
