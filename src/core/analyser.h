#pragma once

/// @file analyser.h
/// @brief FFT magnitude analyser with Web Audio AnalyserNode semantics.

#include <Eigen/Core>
#include <vector>

#include "core/fft.h"
#include "util/types.h"

namespace cadence {

/// @brief Configuration for SpectrumAnalyser.
/// @details Defaults reproduce the analyser the visualizer was tuned against:
///          128-point FFT (64 bins), smoothing 0.5, byte range -100..-30 dB.
struct AnalyserConfig {
  int fft_size = 128;                        ///< FFT size (power of 2, 32..32768)
  float smoothing = 0.5f;                    ///< Temporal smoothing constant [0, 1)
  float min_decibels = -100.0f;              ///< dB mapped to byte 0
  float max_decibels = -30.0f;               ///< dB mapped to byte 255
  WindowType window = WindowType::Blackman;  ///< Analysis window

  /// @brief Returns number of bins in the byte spectrum (fft_size / 2).
  int bin_count() const { return fft_size / 2; }

  /// @brief Checks every field.
  /// @throws CadenceException(InvalidConfiguration) naming the offending field
  void validate() const;
};

/// @brief Computes 8-bit magnitude spectra from time-domain PCM.
/// @details Per call: window the last fft_size samples, forward FFT, scale |X| by 1/N,
///          blend with the previous magnitudes using the smoothing constant, convert to dB,
///          and map [min_decibels, max_decibels] linearly onto [0, 255].
class SpectrumAnalyser {
 public:
  /// @brief Constructs analyser.
  /// @param config Analyser configuration
  /// @throws CadenceException(InvalidConfiguration) if config is invalid
  explicit SpectrumAnalyser(const AnalyserConfig& config = AnalyserConfig());

  /// @brief Computes the byte spectrum for one block.
  /// @param time_domain Most recent fft_size samples, oldest first
  /// @return Spectrum with bin_count() bins
  Spectrum get_byte_frequency_data(const float* time_domain);

  /// @brief Clears smoothing history.
  void reset();

  int fft_size() const { return config_.fft_size; }
  int bin_count() const { return config_.bin_count(); }
  const AnalyserConfig& config() const { return config_; }

 private:
  void update_smoothed(const float* time_domain);

  AnalyserConfig config_;
  FFT fft_;
  std::vector<float> window_;
  std::vector<float> windowed_;   // [fft_size]
  std::vector<float> magnitude_;  // [fft_size / 2 + 1]
  Eigen::ArrayXf smoothed_;       // [bin_count]
};

}  // namespace cadence
