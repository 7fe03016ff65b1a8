#pragma once

/// @file peak_detector.h
/// @brief Bass onset detection with a bounded window of recent peak times.
///
/// A peak fires when all of the following hold for the current bass energy E at time t:
/// - the previous energy E' is non-zero (no spurious peak on the first tick after a reset),
/// - E exceeds the absolute threshold,
/// - E exceeds E' by the rise ratio,
/// - t is more than the refractory distance after the last accepted peak.
///
/// This rising-edge detector is tuned for bass-heavy music. It does not compute spectral
/// flux and does not adapt its threshold to track loudness.

#include <cstddef>
#include <deque>

namespace cadence {

/// @brief Configuration for PeakDetector.
struct PeakConfig {
  float threshold = 0.65f;          ///< Absolute bass energy threshold
  float rise_ratio = 1.2f;          ///< Required rise over the previous tick's energy
  double min_peak_distance = 0.2;   ///< Refractory period in seconds
  double window_seconds = 5.0;      ///< PeakWindow retention in seconds

  /// @throws CadenceException(InvalidConfiguration) if any value is zero, negative or
  ///         non-finite
  void validate() const;
};

/// @brief Peak timestamps within a sliding window of the most recent insertion.
class PeakWindow {
 public:
  /// @param window_seconds Retention; entries older than latest - window_seconds are evicted
  explicit PeakWindow(double window_seconds = 5.0) : window_seconds_(window_seconds) {}

  /// @brief Appends a timestamp and evicts expired entries.
  /// @param timestamp Peak time; callers insert in increasing order
  void insert(double timestamp);

  void clear() { peaks_.clear(); }
  size_t size() const { return peaks_.size(); }
  bool empty() const { return peaks_.empty(); }

  /// @brief Most recent timestamp (0 if empty).
  double latest() const { return peaks_.empty() ? 0.0 : peaks_.back(); }

  double window_seconds() const { return window_seconds_; }

  const std::deque<double>& peaks() const { return peaks_; }
  std::deque<double>::const_iterator begin() const { return peaks_.begin(); }
  std::deque<double>::const_iterator end() const { return peaks_.end(); }

 private:
  double window_seconds_;
  std::deque<double> peaks_;
};

/// @brief Rising-edge bass onset detector.
class PeakDetector {
 public:
  /// @throws CadenceException(InvalidConfiguration) if config is invalid
  explicit PeakDetector(const PeakConfig& config = PeakConfig());

  /// @brief Processes one tick of bass energy.
  /// @param bass_energy Bass band energy in [0, 1]
  /// @param now Tick time in seconds
  /// @return True if a peak fired (and was recorded in the window)
  bool detect(float bass_energy, double now);

  /// @brief Clears previous energy, last peak time and the window.
  void reset();

  const PeakWindow& window() const { return window_; }
  float previous_energy() const { return previous_energy_; }
  double last_peak_time() const { return last_peak_time_; }
  const PeakConfig& config() const { return config_; }

 private:
  PeakConfig config_;
  PeakWindow window_;
  float previous_energy_ = 0.0f;
  double last_peak_time_ = 0.0;
};

}  // namespace cadence
