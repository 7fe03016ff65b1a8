/// @file peak_detector_test.cpp
/// @brief Tests for PeakDetector and PeakWindow.

#include "analysis/peak_detector.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include "util/exception.h"

using namespace cadence;
using Catch::Matchers::WithinAbs;

TEST_CASE("PeakDetector firing conditions", "[peak_detector]") {
  PeakDetector detector;

  SECTION("first sample never fires") {
    REQUIRE_FALSE(detector.detect(0.9f, 1.0));
    REQUIRE(detector.previous_energy() == 0.9f);
  }

  SECTION("rise over threshold fires") {
    detector.detect(0.1f, 1.0);
    REQUIRE(detector.detect(0.8f, 1.1));
    REQUIRE(detector.window().size() == 1);
    REQUIRE(detector.last_peak_time() == 1.1);
  }

  SECTION("below threshold") {
    detector.detect(0.1f, 1.0);
    REQUIRE_FALSE(detector.detect(0.6f, 1.1));
  }

  SECTION("insufficient rise") {
    detector.detect(0.7f, 1.0);
    REQUIRE_FALSE(detector.detect(0.8f, 1.1));
  }

  SECTION("silence before the pulse blocks it") {
    detector.detect(0.0f, 1.0);
    REQUIRE_FALSE(detector.detect(0.8f, 1.1));
  }

  SECTION("refractory period") {
    detector.detect(0.1f, 1.0);
    REQUIRE(detector.detect(0.8f, 1.1));
    detector.detect(0.1f, 1.15);
    REQUIRE_FALSE(detector.detect(0.8f, 1.2));
    detector.detect(0.1f, 1.25);
    REQUIRE(detector.detect(0.8f, 1.35));
  }
}

TEST_CASE("PeakDetector alternating pulses", "[peak_detector]") {
  PeakDetector detector;
  std::vector<double> peaks;

  double t = 0.25;
  for (int i = 0; i < 10; ++i, t += 0.5) {
    detector.detect(0.1f, t);
    if (detector.detect(0.8f, t + 0.25)) peaks.push_back(t + 0.25);
  }

  REQUIRE(peaks.size() == 10);
  REQUIRE_THAT(peaks[0], WithinAbs(0.5, 1e-9));
  REQUIRE_THAT(peaks[1], WithinAbs(1.0, 1e-9));
}

TEST_CASE("PeakDetector refractory invariant", "[peak_detector]") {
  PeakDetector detector;

  // Dense pulse train: every other 1/30 s tick is loud
  for (int i = 1; i <= 300; ++i) {
    detector.detect(i % 2 == 0 ? 0.9f : 0.1f, i / 30.0);
  }

  const auto& peaks = detector.window().peaks();
  REQUIRE(peaks.size() > 1);
  for (size_t i = 1; i < peaks.size(); ++i) {
    REQUIRE(peaks[i] - peaks[i - 1] > 0.2);
  }
}

TEST_CASE("PeakWindow eviction", "[peak_detector]") {
  PeakWindow window(5.0);
  for (int t = 1; t <= 8; ++t) {
    window.insert(t);
  }

  // Entries older than latest - 5 s are dropped; latest - 5 itself is kept
  REQUIRE(window.size() == 6);
  REQUIRE(window.peaks().front() == 3.0);
  REQUIRE(window.latest() == 8.0);
}

TEST_CASE("PeakDetector reset", "[peak_detector]") {
  PeakDetector detector;
  detector.detect(0.1f, 1.0);
  detector.detect(0.8f, 1.1);
  REQUIRE_FALSE(detector.window().empty());

  detector.reset();
  REQUIRE(detector.window().empty());
  REQUIRE(detector.previous_energy() == 0.0f);
  REQUIRE(detector.last_peak_time() == 0.0);
}

TEST_CASE("PeakConfig validation", "[peak_detector]") {
  PeakConfig config;
  REQUIRE_NOTHROW(config.validate());

  SECTION("threshold") {
    config.threshold = 0.0f;
    REQUIRE_THROWS_AS(config.validate(), CadenceException);
  }

  SECTION("rise ratio") {
    config.rise_ratio = -1.0f;
    REQUIRE_THROWS_AS(config.validate(), CadenceException);
  }

  SECTION("min peak distance") {
    config.min_peak_distance = 0.0;
    REQUIRE_THROWS_AS(PeakDetector(config), CadenceException);
  }

  SECTION("window length") {
    config.window_seconds = -5.0;
    REQUIRE_THROWS_AS(config.validate(), CadenceException);
  }
}
