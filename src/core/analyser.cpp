/// @file analyser.cpp
/// @brief Implementation of SpectrumAnalyser.

#include "core/analyser.h"

#include <cmath>
#include <string>

#include "core/window.h"
#include "util/exception.h"

namespace cadence {

namespace {

constexpr int kMinFftSize = 32;
constexpr int kMaxFftSize = 32768;

/// @brief Magnitude floor before log10 (-400 dB, far below any byte range).
constexpr float kMinMagnitude = 1e-20f;

bool is_power_of_two(int n) { return n > 0 && (n & (n - 1)) == 0; }

const AnalyserConfig& validated(const AnalyserConfig& config) {
  config.validate();
  return config;
}

}  // namespace

void AnalyserConfig::validate() const {
  CADENCE_CHECK_MSG(is_power_of_two(fft_size) && fft_size >= kMinFftSize &&
                        fft_size <= kMaxFftSize,
                    ErrorCode::InvalidConfiguration,
                    "fft_size must be a power of two in [32, 32768], got " +
                        std::to_string(fft_size));
  CADENCE_CHECK_MSG(smoothing >= 0.0f && smoothing < 1.0f, ErrorCode::InvalidConfiguration,
                    "smoothing must be in [0, 1)");
  CADENCE_CHECK_MSG(std::isfinite(min_decibels) && std::isfinite(max_decibels) &&
                        max_decibels > min_decibels,
                    ErrorCode::InvalidConfiguration,
                    "max_decibels must be greater than min_decibels");
}

SpectrumAnalyser::SpectrumAnalyser(const AnalyserConfig& config)
    : config_(validated(config)), fft_(config.fft_size) {
  window_ = create_window(config_.window, config_.fft_size, true);
  windowed_.resize(config_.fft_size);
  magnitude_.resize(fft_.n_bins());
  smoothed_ = Eigen::ArrayXf::Zero(config_.bin_count());
}

void SpectrumAnalyser::update_smoothed(const float* time_domain) {
  for (int i = 0; i < config_.fft_size; ++i) {
    windowed_[i] = time_domain[i] * window_[i];
  }
  fft_.forward_magnitude(windowed_.data(), magnitude_.data());

  /// Nyquist bin is dropped: the byte spectrum has fft_size / 2 bins
  Eigen::Map<const Eigen::ArrayXf> current(magnitude_.data(), config_.bin_count());
  smoothed_ = config_.smoothing * smoothed_ + (1.0f - config_.smoothing) * current;

  /// NaN/Inf input must not poison the smoothing history
  smoothed_ = smoothed_.isFinite().select(smoothed_, 0.0f);
}

Spectrum SpectrumAnalyser::get_byte_frequency_data(const float* time_domain) {
  update_smoothed(time_domain);

  const float range = config_.max_decibels - config_.min_decibels;
  Eigen::ArrayXf db = 20.0f * smoothed_.max(kMinMagnitude).log10();
  Eigen::ArrayXf scaled =
      ((db - config_.min_decibels) * (255.0f / range)).floor().max(0.0f).min(255.0f);

  Spectrum spectrum(static_cast<size_t>(config_.bin_count()));
  for (int k = 0; k < config_.bin_count(); ++k) {
    spectrum[k] = static_cast<uint8_t>(scaled(k));
  }
  return spectrum;
}

void SpectrumAnalyser::reset() { smoothed_.setZero(); }

}  // namespace cadence
