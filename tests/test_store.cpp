#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstdlib>

#include <vdot/calculator.hpp>
#include <vdot/codec.hpp>
#include <vdot/generator.hpp>
#include <vdot/store.hpp>

using Catch::Approx;
using namespace vdot;

TEST_CASE("embedded table covers the full grid") {
  const auto& t = embedded_table();
  REQUIRE(t.size() == 551);
  REQUIRE(t.first_index() == kFirstIndex);
  REQUIRE(t.last_index() == kLastIndex);
  // Decoded once; same object afterwards
  REQUIRE(&embedded_table() == &t);
}

TEST_CASE("embedded table equals a fresh generation run") {
  const auto fresh = generate_table();
  REQUIRE(embedded_table() == fresh);
  REQUIRE(decode_table(encode_table(fresh)) == fresh);
}

TEST_CASE("lookup boundaries") {
  const auto& t = embedded_table();
  REQUIRE_FALSE(t.lookup(29.9).has_value());
  REQUIRE_FALSE(t.lookup(85.1).has_value());
  REQUIRE(t.lookup(30.0).has_value());
  REQUIRE(t.lookup(85.0).has_value());
}

TEST_CASE("race times never increase with fitness") {
  const auto& rows = embedded_table().rows();
  for (std::size_t i = 0; i + 1 < rows.size(); ++i) {
    for (std::size_t d = 0; d < kRaceCount; ++d) {
      INFO("index " << rows[i].v << " distance " << d);
      REQUIRE(rows[i + 1].race_s[d] <= rows[i].race_s[d]);
    }
  }
}

TEST_CASE("race times grow with distance and paces order by intensity") {
  for (const auto& r : embedded_table().rows()) {
    INFO("index " << r.v);
    for (std::size_t d = 0; d + 1 < kRaceCount; ++d) {
      REQUIRE(r.race_s[d] < r.race_s[d + 1]);
    }
    REQUIRE(r.easy_slow >= r.easy_fast);
    REQUIRE(r.easy_fast >= r.marathon);
    REQUIRE(r.marathon >= r.threshold);
    REQUIRE(r.threshold >= r.interval);
    REQUIRE(r.interval >= r.repetition);
    REQUIRE(r.interval - r.repetition == repetition_offset(r.score()));
  }
}

TEST_CASE("grid lookups agree with live computation from a performance") {
  const auto& t = embedded_table();
  for (int v = kFirstIndex; v <= kLastIndex; ++v) {
    INFO("index " << v);
    // A 10K run in exactly the equivalent time has forward score v / 10
    const auto secs = equivalent_race_seconds(v / 10.0, 10000.0);
    REQUIRE(secs.has_value());
    const auto ev = evaluate(Performance{10000.0, *secs});
    REQUIRE(ev.score.has_value());
    REQUIRE(*ev.score == Approx(v / 10.0).margin(1e-9));

    const auto grid = t.lookup(v / 10.0);
    REQUIRE(grid.has_value());
    REQUIRE(ev.row.has_value());
    REQUIRE(ev.row->v == grid->v);
    for (std::size_t d = 0; d < kRaceCount; ++d) {
      REQUIRE(std::abs(ev.row->race_s[d] - grid->race_s[d]) <= 1);
    }
    REQUIRE(std::abs(ev.row->easy_slow - grid->easy_slow) <= 1);
    REQUIRE(std::abs(ev.row->easy_fast - grid->easy_fast) <= 1);
    REQUIRE(std::abs(ev.row->marathon - grid->marathon) <= 1);
    REQUIRE(std::abs(ev.row->threshold - grid->threshold) <= 1);
    REQUIRE(std::abs(ev.row->interval - grid->interval) <= 1);
    REQUIRE(std::abs(ev.row->repetition - grid->repetition) <= 1);
  }
}

TEST_CASE("live rows near 50.0 use the same repetition offset as the stored row") {
  for (double score : {49.95, 49.96, 49.99, 50.04, 49.94}) {
    INFO("score " << score);
    const auto live = equivalence_row(score);
    const auto grid = embedded_table().lookup(score);
    REQUIRE(live.has_value());
    REQUIRE(grid.has_value());
    REQUIRE(live->v == grid->v);
    REQUIRE(live->interval - live->repetition == grid->interval - grid->repetition);
  }
}

TEST_CASE("scenario: score 50.0") {
  const auto r = embedded_table().lookup(50.0);
  REQUIRE(r.has_value());
  REQUIRE(r->race_s[3] == 11440);   // 3:10:40
  REQUIRE(r->repetition == r->interval - 15);
}

TEST_CASE("scenario: 10K in 40:00") {
  const auto ev = evaluate(Performance{10000.0, 2400.0}, &embedded_table());
  REQUIRE(ev.score.has_value());
  REQUIRE(*ev.score == Approx(51.94).margin(0.01));
  REQUIRE(ev.from_table);
  REQUIRE(ev.row->v == 519);
  REQUIRE(std::abs(ev.row->race_s[1] - 2400) <= 5);
}
