#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <array>
#include <cmath>
#include <cstdlib>

#include <vdot/calculator.hpp>

using Catch::Approx;
using namespace vdot;

TEST_CASE("equivalence_row at a score of 50.0") {
  auto row = equivalence_row(50.0);
  REQUIRE(row.has_value());
  REQUIRE(row->v == 500);
  REQUIRE(row->race_s == std::array<int, kRaceCount>{1196, 2480, 5491, 11440});
  REQUIRE(row->easy_slow == 334);
  REQUIRE(row->easy_fast == 295);
  REQUIRE(row->marathon == 271);
  REQUIRE(row->threshold == 255);
  REQUIRE(row->interval == 235);
  REQUIRE(row->repetition == row->interval - 15);
}

TEST_CASE("repetition offset steps at a score of 50") {
  REQUIRE(repetition_offset(49.9) == 20);
  REQUIRE(repetition_offset(50.0) == 15);

  auto below = equivalence_row(49.9);
  REQUIRE(below.has_value());
  REQUIRE(below->interval == 235);
  REQUIRE(below->repetition == 215);

  auto at = equivalence_row(50.0);
  REQUIRE(at.has_value());
  REQUIRE(at->repetition == 220);

  SECTION("live scores take the offset of the grid key they round to") {
    auto up = equivalence_row(49.96);
    REQUIRE(up.has_value());
    REQUIRE(up->v == 500);
    REQUIRE(up->repetition == up->interval - 15);

    auto down = equivalence_row(50.04);
    REQUIRE(down.has_value());
    REQUIRE(down->v == 500);
    REQUIRE(down->repetition == down->interval - 15);

    auto below = equivalence_row(49.94);
    REQUIRE(below.has_value());
    REQUIRE(below->v == 499);
    REQUIRE(below->repetition == below->interval - 20);
  }
}

TEST_CASE("equivalence_row at the grid edges") {
  auto lo = equivalence_row(30.0);
  REQUIRE(lo.has_value());
  REQUIRE(lo->race_s == std::array<int, kRaceCount>{1841, 3829, 8477, 17389});
  REQUIRE(lo->repetition == 334);

  auto hi = equivalence_row(85.0);
  REQUIRE(hi.has_value());
  REQUIRE(hi->race_s == std::array<int, kRaceCount>{757, 1579, 3471, 7275});
  REQUIRE(hi->easy_slow == 218);
  REQUIRE(hi->repetition == 138);
}

TEST_CASE("equivalence_row is unavailable when a distance has no root") {
  REQUIRE_FALSE(equivalence_row(5.0).has_value());
  REQUIRE_FALSE(equivalence_row(std::nan("")).has_value());
}

TEST_CASE("equivalent_race_seconds is unrounded") {
  auto s = equivalent_race_seconds(50.0, 10000.0);
  REQUIRE(s.has_value());
  REQUIRE(*s == Approx(2479.6036).margin(1e-3));
  // Arbitrary distances work too
  auto mile = equivalent_race_seconds(50.0, 1609.344);
  REQUIRE(mile.has_value());
  REQUIRE(*mile < *s);
}

TEST_CASE("evaluate computes score and live row without a table") {
  const auto ev = evaluate(Performance{10000.0, 40.0 * 60.0});
  REQUIRE(ev.score.has_value());
  REQUIRE(*ev.score == Approx(51.944).margin(0.001));
  REQUIRE(*ev.rounded_score == Approx(51.9));
  REQUIRE(ev.row.has_value());
  REQUIRE_FALSE(ev.from_table);
  // The live row reproduces the input performance
  REQUIRE(std::abs(ev.row->race_s[1] - 2400) <= 1);
}

TEST_CASE("evaluate with a table uses exact-key lookup") {
  auto r519 = equivalence_row(51.9);
  REQUIRE(r519.has_value());
  const PrecomputedTable table({*r519});

  const auto ev = evaluate(Performance{10000.0, 40.0 * 60.0}, &table);
  REQUIRE(ev.from_table);
  REQUIRE(ev.row.has_value());
  REQUIRE(ev.row->v == 519);
  REQUIRE(ev.row->race_s[1] == 2402);

  // Off the stored range -> unavailable, never computed live
  const auto slow = evaluate(Performance{10000.0, 60.0 * 60.0}, &table);
  REQUIRE(slow.score.has_value());
  REQUIRE_FALSE(slow.row.has_value());
  REQUIRE_FALSE(slow.from_table);
}

TEST_CASE("evaluate without a valid input yields nothing") {
  const auto ev = evaluate(Performance{10000.0, 0.0});
  REQUIRE_FALSE(ev.score.has_value());
  REQUIRE_FALSE(ev.rounded_score.has_value());
  REQUIRE_FALSE(ev.row.has_value());
  REQUIRE_FALSE(evaluate_score(std::nan("")).score.has_value());
}

TEST_CASE("training_pace_range spans each zone's effort band") {
  const auto easy = training_pace_range(50.0, Zone::Easy);
  REQUIRE(easy.slower == Approx(351.8895).margin(1e-3));
  REQUIRE(easy.faster == Approx(293.5327).margin(1e-3));

  const auto rep = training_pace_range(50.0, Zone::Repetition);
  REQUIRE(rep.faster < rep.slower);
  REQUIRE(rep.slower < training_pace_range(50.0, Zone::Interval).faster);
}
