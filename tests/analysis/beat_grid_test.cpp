/// @file beat_grid_test.cpp
/// @brief Tests for BeatGrid.

#include "analysis/beat_grid.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "util/exception.h"

using namespace cadence;
using Catch::Matchers::WithinAbs;

namespace {
const TempoState kTempo120{120, 0.5};
}  // namespace

TEST_CASE("BeatGrid first check anchors", "[beat_grid]") {
  BeatGrid grid;
  REQUIRE_FALSE(grid.aligned());

  REQUIRE(grid.check(3.2, kTempo120));
  REQUIRE(grid.aligned());
  REQUIRE(grid.last_beat_time() == 3.2);
}

TEST_CASE("BeatGrid on-schedule window", "[beat_grid]") {
  BeatGrid grid;
  grid.check(1.0, kTempo120);

  SECTION("early ticks are not beats") {
    REQUIRE_FALSE(grid.check(1.3, kTempo120));
    REQUIRE_FALSE(grid.check(1.44, kTempo120));
    REQUIRE(grid.last_beat_time() == 1.0);
  }

  SECTION("ticks within tolerance are beats") {
    REQUIRE(grid.check(1.46, kTempo120));
    REQUIRE(grid.last_beat_time() == 1.46);
    REQUIRE(grid.check(2.0, kTempo120));
  }

  SECTION("late tick within tolerance") {
    REQUIRE(grid.check(1.54, kTempo120));
  }

  SECTION("tick between tolerance and the large-gap limit") {
    REQUIRE_FALSE(grid.check(1.7, kTempo120));
    REQUIRE(grid.last_beat_time() == 1.0);
  }
}

TEST_CASE("BeatGrid self-heals after a gap", "[beat_grid]") {
  BeatGrid grid;
  grid.check(1.0, kTempo120);
  REQUIRE(grid.check(1.5, kTempo120));

  SECTION("gap ending on the grid beats immediately") {
    // 5.96 intervals later: re-anchored at 4.0, 0.48 s elapsed
    REQUIRE(grid.check(4.48, kTempo120));
    REQUIRE(grid.last_beat_time() == 4.48);
  }

  SECTION("gap ending off the grid beats one interval after the re-anchor") {
    REQUIRE_FALSE(grid.check(4.02, kTempo120));
    REQUIRE_THAT(grid.last_beat_time(), WithinAbs(4.0, 1e-9));

    // Host resumes 30 Hz ticks; the first beat lands within interval +/- tolerance
    double first_beat = 0.0;
    for (int i = 1; i <= 30 && first_beat == 0.0; ++i) {
      double now = 4.02 + i / 30.0;
      if (grid.check(now, kTempo120)) first_beat = now;
    }
    REQUIRE(first_beat > 0.0);
    REQUIRE(first_beat >= 4.0 + 0.5 - 0.05);
    REQUIRE(first_beat <= 4.0 + 0.5 + 0.05);
  }
}

TEST_CASE("BeatGrid follows tempo changes", "[beat_grid]") {
  BeatGrid grid;
  const TempoState tempo150{150, 0.4};

  grid.check(1.0, kTempo120);
  REQUIRE(grid.check(1.4, tempo150));
  REQUIRE_FALSE(grid.check(1.9, tempo150));
  REQUIRE(grid.last_beat_time() == 1.4);
}

TEST_CASE("BeatGrid ignores invalid intervals", "[beat_grid]") {
  BeatGrid grid;
  REQUIRE_FALSE(grid.check(1.0, TempoState{120, 0.0}));
  REQUIRE_FALSE(grid.aligned());
}

TEST_CASE("BeatGrid reset", "[beat_grid]") {
  BeatGrid grid;
  grid.check(1.0, kTempo120);
  grid.reset();
  REQUIRE_FALSE(grid.aligned());
  REQUIRE(grid.last_beat_time() == 0.0);
  REQUIRE(grid.check(1.1, kTempo120));
}

TEST_CASE("BeatGridConfig validation", "[beat_grid]") {
  BeatGridConfig config;
  REQUIRE(config.tolerance == 0.05);
  REQUIRE_NOTHROW(config.validate());

  config.tolerance = 0.0;
  REQUIRE_THROWS_AS(config.validate(), CadenceException);
  REQUIRE_THROWS_AS(BeatGrid(config), CadenceException);
}
