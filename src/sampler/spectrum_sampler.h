#pragma once

/// @file spectrum_sampler.h
/// @brief Per-tick spectrum sampling interface and its provider.

#include <memory>
#include <string>

#include "core/analyser.h"
#include "util/types.h"

namespace cadence {

/// @brief Returns one magnitude spectrum per analysis tick.
/// @details Resolution and smoothing are fixed for the lifetime of a sampler. A sampler is
///          the session's handle on the underlying audio graph: destroying it stops polling.
class SpectrumSampler {
 public:
  virtual ~SpectrumSampler() = default;

  /// @brief Reads the current spectrum.
  /// @return bin_count() bins in [0, 255]
  /// @throws CadenceException(SourceUnavailable) if no audio graph is connected or ready
  virtual Spectrum sample() = 0;

  /// @brief FFT size used by the analyser.
  virtual int fft_size() const = 0;

  /// @brief Number of bins returned by sample().
  virtual int bin_count() const = 0;

  /// @brief Temporal smoothing constant of the analyser.
  virtual float smoothing() const = 0;
};

/// @brief Opens samplers for source identifiers.
class SamplerProvider {
 public:
  virtual ~SamplerProvider() = default;

  /// @brief Connects a sampler to the named source.
  /// @param source_id Source identifier (file path, "system:<device>", ...)
  /// @param config Analyser configuration
  /// @return Owning sampler handle
  /// @throws CadenceException(SourceUnavailable) if the audio graph is not ready yet
  /// @throws CadenceException(InvalidParameter) if the source is unknown
  virtual std::unique_ptr<SpectrumSampler> open(const std::string& source_id,
                                                const AnalyserConfig& config) = 0;
};

}  // namespace cadence
