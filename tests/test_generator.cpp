#include <catch2/catch_test_macros.hpp>

#include <vdot/calculator.hpp>
#include <vdot/generator.hpp>

using namespace vdot;

TEST_CASE("generate_row matches the live calculator") {
  const auto row = generate_row(514);
  REQUIRE(row.v == 514);
  REQUIRE(row == *equivalence_row(51.4));
  REQUIRE(row.race_s[1] == 2422);
}

TEST_CASE("generate_table covers the configured grid") {
  GeneratorConfig cfg;
  cfg.first_index = 495;
  cfg.last_index = 505;
  const auto t = generate_table(cfg);
  REQUIRE(t.size() == 11);
  REQUIRE(t.first_index() == 495);
  REQUIRE(t.last_index() == 505);
  REQUIRE(t.at_index(500)->race_s[3] == 11440);
}

TEST_CASE("generate_table gives identical results with workers") {
  GeneratorConfig serial;
  serial.first_index = 600;
  serial.last_index = 640;

  GeneratorConfig parallel = serial;
  parallel.workers = 4;
  REQUIRE(generate_table(serial) == generate_table(parallel));

  // More workers than rows
  GeneratorConfig tiny = serial;
  tiny.last_index = 601;
  tiny.workers = 16;
  REQUIRE(generate_table(tiny).size() == 2);
}

TEST_CASE("generate_table aborts instead of returning a partial table") {
  GeneratorConfig cfg;
  cfg.first_index = 300;
  cfg.last_index = 320;
  cfg.bracket = Bracket{1.0, 30.0};   // no 10K root for these scores
  REQUIRE_THROWS_AS(generate_table(cfg), GenerationError);

  cfg.workers = 3;
  REQUIRE_THROWS_AS(generate_table(cfg), GenerationError);

  REQUIRE_THROWS_AS(generate_row(50), GenerationError);
}

TEST_CASE("generate_table rejects an empty grid") {
  GeneratorConfig cfg;
  cfg.first_index = 500;
  cfg.last_index = 499;
  REQUIRE_THROWS_AS(generate_table(cfg), GenerationError);
}
