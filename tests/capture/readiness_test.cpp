#include "capture/readiness.hpp"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("readiness waits are clamped", "[capture][readiness]") {
  REQUIRE(dscapture::capture::ClampSleepSeconds(0) == 1);
  REQUIRE(dscapture::capture::ClampSleepSeconds(-20) == 1);
  REQUIRE(dscapture::capture::ClampSleepSeconds(30) == 30);
  REQUIRE(dscapture::capture::ClampSleepSeconds(5000) == 900);
}

TEST_CASE("aged items wait less", "[capture][readiness]") {
  using dscapture::capture::ComputeAgedSleepInterval;
  REQUIRE(ComputeAgedSleepInterval(0.5, 30) == 30);
  REQUIRE(ComputeAgedSleepInterval(9.9, 30) == 30);
  REQUIRE(ComputeAgedSleepInterval(20.0, 30) == 17);
  REQUIRE(ComputeAgedSleepInterval(30.0, 30) == 3);
  REQUIRE(ComputeAgedSleepInterval(45.0, 30) == 3);
}

TEST_CASE("aged interval never drops below the minimum", "[capture][readiness]") {
  using dscapture::capture::ComputeAgedSleepInterval;
  REQUIRE(ComputeAgedSleepInterval(20.0, 1) == 3);
  REQUIRE(ComputeAgedSleepInterval(15.0, 60, 10) == 48);
}
