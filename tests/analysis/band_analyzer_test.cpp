/// @file band_analyzer_test.cpp
/// @brief Tests for BandAnalyzer.

#include "analysis/band_analyzer.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <random>

#include "util/exception.h"

using namespace cadence;
using Catch::Matchers::WithinAbs;

TEST_CASE("BandAnalyzer ranges", "[band_analyzer]") {
  BandAnalyzer analyzer;

  SECTION("64 bins") {
    REQUIRE(analyzer.bass_range(64).begin == 0);
    REQUIRE(analyzer.bass_range(64).end == 6);
    REQUIRE(analyzer.mid_range(64).begin == 6);
    REQUIRE(analyzer.mid_range(64).end == 32);
    REQUIRE(analyzer.high_range(64).begin == 32);
    REQUIRE(analyzer.high_range(64).end == 64);
  }

  SECTION("ranges partition the spectrum") {
    for (size_t n : {1u, 5u, 10u, 64u, 1024u}) {
      REQUIRE(analyzer.bass_range(n).size() + analyzer.mid_range(n).size() +
                  analyzer.high_range(n).size() ==
              n);
    }
  }
}

TEST_CASE("BandAnalyzer band energies", "[band_analyzer]") {
  BandAnalyzer analyzer;

  SECTION("full scale") {
    Spectrum spectrum(64, 255);
    FrequencyBands bands = analyzer.analyze(spectrum);
    REQUIRE_THAT(bands.bass, WithinAbs(1.0f, 1e-6f));
    REQUIRE_THAT(bands.mid, WithinAbs(1.0f, 1e-6f));
    REQUIRE_THAT(bands.high, WithinAbs(1.0f, 1e-6f));
    REQUIRE_THAT(analyzer.amplitude(spectrum), WithinAbs(1.0f, 1e-6f));
  }

  SECTION("bass only") {
    Spectrum spectrum(64, 0);
    for (size_t i = 0; i < 6; ++i) spectrum[i] = 255;

    FrequencyBands bands = analyzer.analyze(spectrum);
    REQUIRE_THAT(bands.bass, WithinAbs(1.0f, 1e-6f));
    REQUIRE_THAT(bands.mid, WithinAbs(0.0f, 1e-6f));
    REQUIRE_THAT(bands.high, WithinAbs(0.0f, 1e-6f));
    REQUIRE_THAT(analyzer.amplitude(spectrum), WithinAbs(6.0f / 64.0f, 1e-6f));
  }

  SECTION("mean of the band") {
    Spectrum spectrum(10, 0);
    spectrum[0] = 51;  // bass = bin 0 only
    spectrum[1] = 255;
    spectrum[2] = 0;   // mid = bins 1..4
    FrequencyBands bands = analyzer.analyze(spectrum);
    REQUIRE_THAT(bands.bass, WithinAbs(0.2f, 1e-6f));
    REQUIRE_THAT(bands.mid, WithinAbs(0.25f, 1e-6f));
  }
}

TEST_CASE("BandAnalyzer degenerate spectra", "[band_analyzer]") {
  BandAnalyzer analyzer;

  SECTION("empty") {
    FrequencyBands bands = analyzer.analyze(Spectrum());
    REQUIRE(bands.bass == 0.0f);
    REQUIRE(bands.mid == 0.0f);
    REQUIRE(bands.high == 0.0f);
    REQUIRE(analyzer.amplitude(Spectrum()) == 0.0f);
  }

  SECTION("empty bass band") {
    Spectrum spectrum(5, 255);
    REQUIRE(analyzer.bass_range(5).size() == 0);
    FrequencyBands bands = analyzer.analyze(spectrum);
    REQUIRE(bands.bass == 0.0f);
    REQUIRE_THAT(bands.high, WithinAbs(1.0f, 1e-6f));
  }
}

TEST_CASE("BandAnalyzer values stay in [0, 1]", "[band_analyzer]") {
  BandAnalyzer analyzer;
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> byte(0, 255);
  std::uniform_int_distribution<int> length(0, 512);

  for (int trial = 0; trial < 200; ++trial) {
    Spectrum spectrum(static_cast<size_t>(length(rng)));
    for (auto& v : spectrum) v = static_cast<uint8_t>(byte(rng));

    FrequencyBands bands = analyzer.analyze(spectrum);
    for (float v : {bands.bass, bands.mid, bands.high, analyzer.amplitude(spectrum)}) {
      REQUIRE(v >= 0.0f);
      REQUIRE(v <= 1.0f);
    }
  }
}

TEST_CASE("BandAnalyzer amplitude prefix", "[band_analyzer]") {
  BandConfig config;
  config.amplitude_bins = 4;
  BandAnalyzer analyzer(config);

  Spectrum spectrum(64, 0);
  for (size_t i = 0; i < 4; ++i) spectrum[i] = 255;
  REQUIRE_THAT(analyzer.amplitude(spectrum), WithinAbs(1.0f, 1e-6f));

  // Prefix longer than the spectrum falls back to the whole spectrum
  Spectrum short_spectrum(2, 255);
  REQUIRE_THAT(analyzer.amplitude(short_spectrum), WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("BandConfig validation", "[band_analyzer]") {
  BandConfig config;
  REQUIRE_NOTHROW(config.validate());

  SECTION("bass_end must be positive") {
    config.bass_end = 0.0f;
    REQUIRE_THROWS_AS(config.validate(), CadenceException);
  }

  SECTION("bass_end must precede mid_end") {
    config.bass_end = 0.6f;
    REQUIRE_THROWS_AS(config.validate(), CadenceException);
  }

  SECTION("mid_end within spectrum") {
    config.mid_end = 1.5f;
    REQUIRE_THROWS_AS(config.validate(), CadenceException);
  }

  SECTION("negative amplitude prefix") {
    config.amplitude_bins = -1;
    REQUIRE_THROWS_AS(BandAnalyzer(config), CadenceException);
  }
}
