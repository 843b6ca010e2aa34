#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <vdot/model.hpp>

using Catch::Approx;
using namespace vdot;

TEST_CASE("oxygen cost and sustained fraction") {
  REQUIRE(oxygen_cost(200.0) == Approx(36.0116));
  REQUIRE(fraction_sustained(1.0) == Approx(1.2334535).epsilon(1e-7));
  // Long efforts converge on 80% of VO2max
  REQUIRE(fraction_sustained(1000.0) == Approx(0.8).margin(1e-5));
}

TEST_CASE("vdot_from_performance evaluates the forward model") {
  SECTION("10K in 40:00") {
    auto s = vdot_from_performance(10000.0, 40 * 60);
    REQUIRE(s.has_value());
    REQUIRE(*s == Approx(51.944).margin(0.001));
  }

  SECTION("5K in 20:00") {
    auto s = vdot_from_performance(5000.0, 20 * 60);
    REQUIRE(s.has_value());
    REQUIRE(*s == Approx(49.806).margin(0.001));
  }

  SECTION("non-positive inputs have no score") {
    REQUIRE_FALSE(vdot_from_performance(10000.0, 0.0).has_value());
    REQUIRE_FALSE(vdot_from_performance(0.0, 2400.0).has_value());
    REQUIRE_FALSE(vdot_from_performance(-5.0, 2400.0).has_value());
  }
}

TEST_CASE("race_minutes inverts the residual") {
  auto m = race_minutes(50.0, 42195.0);
  REQUIRE(m.has_value());
  REQUIRE(*m * 60.0 == Approx(11439.74).margin(0.01));
  REQUIRE(race_time_residual(*m, 50.0, 42195.0) == Approx(0.0).margin(1e-9));

  // Solved duration fed forward gives back the score
  auto back = vdot_from_performance(42195.0, *m * 60.0);
  REQUIRE(back.has_value());
  REQUIRE(*back == Approx(50.0).margin(1e-9));
}

TEST_CASE("race_minutes reports no root for implausible scores") {
  // Too slow to finish a marathon inside 600 minutes
  REQUIRE_FALSE(race_minutes(5.0, 42195.0).has_value());
  // A narrow bracket that excludes the answer
  REQUIRE_FALSE(race_minutes(50.0, 10000.0, Bracket{1.0, 30.0}).has_value());
}

TEST_CASE("pace_from_effort gives velocity in meters per minute") {
  const double v = pace_from_effort(50.0, 0.9743);
  REQUIRE(v == Approx(255.3258).margin(1e-4));
  REQUIRE(seconds_per_km(v) == Approx(234.994).margin(1e-3));
  // More effort, faster
  REQUIRE(pace_from_effort(50.0, 1.0) > v);
  REQUIRE(pace_from_effort(60.0, 0.9743) > v);
}
