/// @file fft_test.cpp
/// @brief Tests for FFT wrapper.

#include "core/fft.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <utility>
#include <vector>

#include "util/exception.h"

using namespace cadence;
using Catch::Matchers::WithinAbs;

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;
}  // namespace

TEST_CASE("FFT forward locates a sine", "[fft]") {
  constexpr int n_fft = 64;
  FFT fft(n_fft);

  // Test signal: sine wave at bin 4
  std::vector<float> input(n_fft);
  for (int i = 0; i < n_fft; ++i) {
    input[i] = std::sin(kTwoPi * 4 * i / n_fft);
  }

  std::vector<std::complex<float>> spectrum(fft.n_bins());
  fft.forward(input.data(), spectrum.data());

  float max_mag = 0;
  int max_bin = 0;
  for (int i = 0; i < fft.n_bins(); ++i) {
    float mag = std::abs(spectrum[i]);
    if (mag > max_mag) {
      max_mag = mag;
      max_bin = i;
    }
  }
  REQUIRE(max_bin == 4);
  REQUIRE_THAT(max_mag, WithinAbs(n_fft / 2.0f, 1e-3f));
}

TEST_CASE("FFT DC component", "[fft]") {
  constexpr int n_fft = 8;
  FFT fft(n_fft);

  std::vector<float> input(n_fft, 1.0f);
  std::vector<std::complex<float>> spectrum(fft.n_bins());
  fft.forward(input.data(), spectrum.data());

  REQUIRE_THAT(spectrum[0].real(), WithinAbs(8.0f, 1e-5f));
  for (int i = 1; i < fft.n_bins(); ++i) {
    REQUIRE_THAT(std::abs(spectrum[i]), WithinAbs(0.0f, 1e-5f));
  }
}

TEST_CASE("FFT forward_magnitude scales by 1/N", "[fft]") {
  constexpr int n_fft = 128;
  FFT fft(n_fft);

  std::vector<float> input(n_fft);
  for (int i = 0; i < n_fft; ++i) {
    input[i] = std::cos(kTwoPi * 10 * i / n_fft);
  }

  std::vector<float> magnitude(fft.n_bins());
  fft.forward_magnitude(input.data(), magnitude.data());

  // Unit cosine: |X[k]| = N/2, scaled to 0.5
  REQUIRE_THAT(magnitude[10], WithinAbs(0.5f, 1e-5f));
  REQUIRE_THAT(magnitude[0], WithinAbs(0.0f, 1e-5f));
  REQUIRE_THAT(magnitude[11], WithinAbs(0.0f, 1e-5f));
}

TEST_CASE("FFT sizes", "[fft]") {
  SECTION("bin count") {
    FFT fft(128);
    REQUIRE(fft.n_fft() == 128);
    REQUIRE(fft.n_bins() == 65);
  }

  SECTION("invalid sizes throw") {
    REQUIRE_THROWS_AS(FFT(0), CadenceException);
    REQUIRE_THROWS_AS(FFT(-4), CadenceException);
    REQUIRE_THROWS_AS(FFT(7), CadenceException);
  }
}

TEST_CASE("FFT is movable", "[fft]") {
  FFT a(16);
  FFT b(std::move(a));
  REQUIRE(b.n_fft() == 16);

  std::vector<float> input(16, 1.0f);
  std::vector<float> magnitude(b.n_bins());
  b.forward_magnitude(input.data(), magnitude.data());
  REQUIRE_THAT(magnitude[0], WithinAbs(1.0f, 1e-5f));
}
