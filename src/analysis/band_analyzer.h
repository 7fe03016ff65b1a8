#pragma once

/// @file band_analyzer.h
/// @brief Reduction of a byte spectrum to bass/mid/high energy and amplitude.

#include <cstddef>

#include "util/types.h"

namespace cadence {

/// @brief Three-band energy summary, each band in [0, 1].
struct FrequencyBands {
  float bass = 0.0f;
  float mid = 0.0f;
  float high = 0.0f;
};

/// @brief Band split configuration.
/// @details Split points are fractions of the spectrum length; a band covers
///          [floor(N * start), floor(N * end)).
struct BandConfig {
  float bass_end = 0.1f;   ///< Bass covers the first 10% of bins
  float mid_end = 0.5f;    ///< Mid covers 10%..50%, high the remainder
  int amplitude_bins = 0;  ///< Prefix averaged for amplitude (0 = whole spectrum)

  /// @throws CadenceException(InvalidConfiguration) unless 0 < bass_end < mid_end <= 1
  ///         and amplitude_bins >= 0
  void validate() const;
};

/// @brief Half-open bin range [begin, end).
struct BinRange {
  size_t begin = 0;
  size_t end = 0;

  size_t size() const { return end > begin ? end - begin : 0; }
};

/// @brief Splits spectra into bass/mid/high bands.
/// @details Stateless and deterministic: no smoothing is applied at this layer.
class BandAnalyzer {
 public:
  /// @throws CadenceException(InvalidConfiguration) if config is invalid
  explicit BandAnalyzer(const BandConfig& config = BandConfig());

  /// @brief Computes band energies.
  /// @param spectrum Byte spectrum
  /// @return Mean of bins / 255 per band; an empty band yields 0
  FrequencyBands analyze(const Spectrum& spectrum) const;

  /// @brief Computes overall amplitude.
  /// @param spectrum Byte spectrum
  /// @return Mean of the first amplitude_bins bins / 255, in [0, 1]
  float amplitude(const Spectrum& spectrum) const;

  /// @brief Returns the bin ranges used for a spectrum of n bins.
  BinRange bass_range(size_t n) const;
  BinRange mid_range(size_t n) const;
  BinRange high_range(size_t n) const;

  const BandConfig& config() const { return config_; }

 private:
  BandConfig config_;
};

}  // namespace cadence
