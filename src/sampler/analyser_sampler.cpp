#include "sampler/analyser_sampler.h"

#include "util/exception.h"
#include "util/log.h"

namespace cadence {

AnalyserSampler::AnalyserSampler(const PcmSource* source, const AnalyserConfig& config)
    : source_(source), analyser_(config), block_(static_cast<size_t>(config.fft_size), 0.0f) {}

Spectrum AnalyserSampler::sample() {
  CADENCE_CHECK_MSG(source_ != nullptr, ErrorCode::SourceUnavailable,
                    "No audio graph connected to sampler");
  CADENCE_CHECK_MSG(source_->read_latest(block_.data(), block_.size()),
                    ErrorCode::SourceUnavailable, "Audio source not ready");
  return analyser_.get_byte_frequency_data(block_.data());
}

void PcmSamplerProvider::add_source(const std::string& source_id, const PcmSource* source) {
  CADENCE_CHECK_MSG(!source_id.empty() && source != nullptr, ErrorCode::InvalidParameter,
                    "Source id and source must be set");
  sources_[source_id] = source;
  logger()->debug("registered {} source '{}'", is_system_source(source_id) ? "capture" : "file",
                  source_id);
}

void PcmSamplerProvider::remove_source(const std::string& source_id) {
  sources_.erase(source_id);
}

bool PcmSamplerProvider::has_source(const std::string& source_id) const {
  return sources_.count(source_id) > 0;
}

bool PcmSamplerProvider::is_system_source(const std::string& source_id) {
  return source_id.rfind(kSystemPrefix, 0) == 0;
}

std::unique_ptr<SpectrumSampler> PcmSamplerProvider::open(const std::string& source_id,
                                                          const AnalyserConfig& config) {
  auto it = sources_.find(source_id);
  CADENCE_CHECK_MSG(it != sources_.end(), ErrorCode::InvalidParameter,
                    "Unknown audio source: " + source_id);
  CADENCE_CHECK_MSG(it->second->ready(), ErrorCode::SourceUnavailable,
                    "Audio source not ready: " + source_id);
  return std::make_unique<AnalyserSampler>(it->second, config);
}

}  // namespace cadence
