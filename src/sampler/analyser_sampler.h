#pragma once

/// @file analyser_sampler.h
/// @brief SpectrumSampler backed by a PcmSource and a SpectrumAnalyser.

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/analyser.h"
#include "core/pcm_source.h"
#include "sampler/spectrum_sampler.h"

namespace cadence {

/// @brief Samples the latest fft_size PCM samples of a source through an analyser.
class AnalyserSampler : public SpectrumSampler {
 public:
  /// @brief Constructs sampler.
  /// @param source Borrowed PCM source (may be null: every sample() then fails)
  /// @param config Analyser configuration
  /// @throws CadenceException(InvalidConfiguration) if config is invalid
  AnalyserSampler(const PcmSource* source, const AnalyserConfig& config);

  Spectrum sample() override;
  int fft_size() const override { return analyser_.fft_size(); }
  int bin_count() const override { return analyser_.bin_count(); }
  float smoothing() const override { return analyser_.config().smoothing; }

 private:
  const PcmSource* source_;
  SpectrumAnalyser analyser_;
  std::vector<float> block_;
};

/// @brief Provider over a registry of named PCM sources.
/// @details Identifiers starting with "system:" name capture streams; all other identifiers
///          name file-backed sources. Both kinds are registered the same way.
///          Registered sources are borrowed and must outlive every sampler opened on them.
class PcmSamplerProvider : public SamplerProvider {
 public:
  /// @brief Prefix for capture device identifiers.
  static constexpr const char* kSystemPrefix = "system:";

  /// @brief Registers (or replaces) a source under an identifier.
  /// @note Samplers opened earlier keep reading the source they were opened on. Replacing
  ///       the entry of an open sampler does not redirect it, so the previous source must
  ///       stay alive until that sampler is released.
  void add_source(const std::string& source_id, const PcmSource* source);

  /// @brief Unregisters a source. Samplers opened earlier keep their pointer.
  void remove_source(const std::string& source_id);

  /// @brief True if an identifier is registered.
  bool has_source(const std::string& source_id) const;

  /// @brief True if an identifier names a capture stream.
  static bool is_system_source(const std::string& source_id);

  /// @throws CadenceException(InvalidParameter) if source_id is not registered
  /// @throws CadenceException(SourceUnavailable) if the source is not ready yet
  std::unique_ptr<SpectrumSampler> open(const std::string& source_id,
                                        const AnalyserConfig& config) override;

 private:
  std::map<std::string, const PcmSource*> sources_;
};

}  // namespace cadence
