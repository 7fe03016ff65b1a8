#pragma once

/// @file fft.h
/// @brief Real FFT wrapper using KissFFT.

#include <complex>
#include <memory>
#include <vector>

namespace cadence {

/// @brief Forward real-valued FFT processor using KissFFT.
/// @details One instance per analyser. KissFFT scratch state is modified during
///          computation, so an instance must not be shared between threads.
class FFT {
 public:
  /// @brief Constructs FFT processor.
  /// @param n_fft FFT size (even; power of 2 for efficiency)
  /// @throws CadenceException(InvalidParameter) if n_fft is not a positive even number
  /// @throws CadenceException(OutOfMemory) if KissFFT allocation fails
  explicit FFT(int n_fft);

  ~FFT();

  // Non-copyable, movable
  FFT(const FFT&) = delete;
  FFT& operator=(const FFT&) = delete;
  FFT(FFT&&) noexcept;
  FFT& operator=(FFT&&) noexcept;

  /// @brief Performs forward FFT (real to complex).
  /// @param input Input signal (n_fft samples)
  /// @param output Complex spectrum (n_bins values)
  void forward(const float* input, std::complex<float>* output);

  /// @brief Performs forward FFT and returns scaled magnitudes.
  /// @param input Input signal (n_fft samples)
  /// @param magnitude Output magnitudes |X[k]| / n_fft (n_bins values)
  void forward_magnitude(const float* input, float* magnitude);

  /// @brief Returns FFT size.
  int n_fft() const { return n_fft_; }

  /// @brief Returns number of frequency bins (n_fft/2 + 1).
  int n_bins() const { return n_fft_ / 2 + 1; }

 private:
  int n_fft_;
  std::vector<std::complex<float>> scratch_;
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace cadence
