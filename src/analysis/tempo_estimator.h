#pragma once

/// @file tempo_estimator.h
/// @brief Tempo estimation from an interval histogram of recent peaks.
///
/// @section tempo_algorithm Algorithm Overview
///
/// 1. Take consecutive intervals between peaks in the window.
/// 2. Quantize each interval to the nearest bucket (0.05 s) and count occurrences.
/// 3. Sort buckets by count, descending.
/// 4. Accept the top bucket only if it is the only bucket or its count exceeds the
///    runner-up by the dominance ratio (1.5x). Otherwise the tempo is ambiguous and the
///    previous estimate stays authoritative.
/// 5. Convert to BPM and fold into [90, 180] by doubling or halving.

#include <cstdint>
#include <optional>
#include <vector>

#include "analysis/peak_detector.h"

namespace cadence {

/// @brief Tempo estimate. beat_interval is always positive.
struct TempoState {
  uint32_t bpm = 120;          ///< Rounded tempo
  double beat_interval = 0.5;  ///< Seconds per beat (60 / unrounded tempo)
};

/// @brief One histogram bucket of quantized inter-peak intervals.
struct IntervalBin {
  double interval;  ///< Bucket center in seconds
  int count;        ///< Number of intervals in the bucket
};

/// @brief Configuration for TempoEstimator.
struct TempoConfig {
  int min_peaks = 4;               ///< Peaks required before estimating
  double bucket_seconds = 0.05;    ///< Histogram quantization step
  double dominance_ratio = 1.5;    ///< Required top/runner-up count ratio
  double bpm_min = 90.0;           ///< Lower bound of the folding range
  double bpm_max = 180.0;          ///< Upper bound of the folding range
  uint32_t default_bpm = 120;      ///< Tempo assumed before the first estimate

  /// @brief Tempo state used on a hard reset.
  TempoState default_tempo() const { return {default_bpm, 60.0 / default_bpm}; }

  /// @throws CadenceException(InvalidConfiguration) on non-positive values, a folding
  ///         range narrower than one octave, or a default tempo outside the range
  void validate() const;
};

/// @brief Builds the interval histogram of a peak sequence.
/// @param peaks Peak timestamps in increasing order
/// @param bucket_seconds Quantization step
/// @return Bins sorted by count descending (ties keep ascending interval order)
std::vector<IntervalBin> build_interval_histogram(const std::deque<double>& peaks,
                                                  double bucket_seconds);

/// @brief Folds a tempo into [bpm_min, bpm_max] by octaves.
/// @return Folded tempo, or 0 if bpm is not a positive finite number
double fold_bpm(double bpm, double bpm_min, double bpm_max);

/// @brief Histogram-based tempo estimator.
class TempoEstimator {
 public:
  /// @throws CadenceException(InvalidConfiguration) if config is invalid
  explicit TempoEstimator(const TempoConfig& config = TempoConfig());

  /// @brief Estimates tempo from the peak window.
  /// @param window Recent peaks
  /// @return Estimate, or std::nullopt if there are too few peaks or no dominant interval
  std::optional<TempoState> estimate(const PeakWindow& window);

  /// @brief Histogram built by the last estimate() call that had enough peaks.
  const std::vector<IntervalBin>& last_histogram() const { return histogram_; }

  /// @brief Drops the stored histogram.
  void reset() { histogram_.clear(); }

  const TempoConfig& config() const { return config_; }

 private:
  TempoConfig config_;
  std::vector<IntervalBin> histogram_;
};

}  // namespace cadence
