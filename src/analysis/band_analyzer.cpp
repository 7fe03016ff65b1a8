#include "analysis/band_analyzer.h"

#include <algorithm>
#include <cmath>

#include "util/exception.h"

namespace cadence {

namespace {

constexpr float kByteScale = 1.0f / 255.0f;

size_t split_index(size_t n, float fraction) {
  return std::min(n, static_cast<size_t>(std::floor(static_cast<float>(n) * fraction)));
}

float mean_energy(const Spectrum& spectrum, BinRange range) {
  if (range.size() == 0) {
    return 0.0f;
  }
  unsigned sum = 0;
  for (size_t i = range.begin; i < range.end; ++i) {
    sum += spectrum[i];
  }
  return static_cast<float>(sum) * kByteScale / static_cast<float>(range.size());
}

}  // namespace

void BandConfig::validate() const {
  CADENCE_CHECK_MSG(bass_end > 0.0f && bass_end < mid_end && mid_end <= 1.0f,
                    ErrorCode::InvalidConfiguration,
                    "band split must satisfy 0 < bass_end < mid_end <= 1");
  CADENCE_CHECK_MSG(amplitude_bins >= 0, ErrorCode::InvalidConfiguration,
                    "amplitude_bins must not be negative");
}

BandAnalyzer::BandAnalyzer(const BandConfig& config) : config_(config) { config_.validate(); }

BinRange BandAnalyzer::bass_range(size_t n) const { return {0, split_index(n, config_.bass_end)}; }

BinRange BandAnalyzer::mid_range(size_t n) const {
  return {split_index(n, config_.bass_end), split_index(n, config_.mid_end)};
}

BinRange BandAnalyzer::high_range(size_t n) const { return {split_index(n, config_.mid_end), n}; }

FrequencyBands BandAnalyzer::analyze(const Spectrum& spectrum) const {
  const size_t n = spectrum.size();
  FrequencyBands bands;
  bands.bass = mean_energy(spectrum, bass_range(n));
  bands.mid = mean_energy(spectrum, mid_range(n));
  bands.high = mean_energy(spectrum, high_range(n));
  return bands;
}

float BandAnalyzer::amplitude(const Spectrum& spectrum) const {
  size_t n = spectrum.size();
  if (config_.amplitude_bins > 0) {
    n = std::min(n, static_cast<size_t>(config_.amplitude_bins));
  }
  return mean_energy(spectrum, {0, n});
}

}  // namespace cadence
