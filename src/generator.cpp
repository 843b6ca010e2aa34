#include <vdot/generator.hpp>
#include <vdot/calculator.hpp>
#include <algorithm>
#include <exception>
#include <string>
#include <thread>
#include <vector>

namespace vdot {

EquivalenceRow generate_row(int v, Bracket bracket) {
  const double score = v / 10.0;
  if (auto row = equivalence_row(score, bracket); row.has_value()) {
    return *row;
  }

  std::string what = "no solution for grid index " + std::to_string(v);
  for (const auto& race : race_catalog()) {
    if (!race_minutes(score, race.distance_m, bracket)) {
      what += " (" + race.key + " has no root in [" + std::to_string(bracket.lo) +
              ", " + std::to_string(bracket.hi) + "] min)";
      break;
    }
  }
  throw GenerationError(what);
}

PrecomputedTable generate_table(const GeneratorConfig& cfg) {
  if (cfg.last_index < cfg.first_index) {
    throw GenerationError("empty grid: " + std::to_string(cfg.first_index) +
                          " > " + std::to_string(cfg.last_index));
  }
  const std::size_t n = static_cast<std::size_t>(cfg.last_index - cfg.first_index + 1);
  std::vector<EquivalenceRow> rows(n);

  // Each worker fills a disjoint contiguous slice of `rows`.
  auto fill = [&](std::size_t begin, std::size_t end) {
    for (std::size_t k = begin; k < end; ++k) {
      rows[k] = generate_row(cfg.first_index + static_cast<int>(k), cfg.bracket);
    }
  };

  const std::size_t workers = std::clamp<std::size_t>(cfg.workers, 1, n);
  if (workers == 1) {
    fill(0, n);
    return PrecomputedTable{std::move(rows)};
  }

  std::vector<std::thread> threads;
  std::vector<std::exception_ptr> errors(workers);
  threads.reserve(workers);
  const std::size_t chunk = (n + workers - 1) / workers;
  for (std::size_t w = 0; w < workers; ++w) {
    const std::size_t begin = std::min(n, w * chunk);
    const std::size_t end   = std::min(n, begin + chunk);
    threads.emplace_back([&, w, begin, end] {
      try {
        fill(begin, end);
      } catch (...) {
        errors[w] = std::current_exception();
      }
    });
  }
  for (auto& th : threads) th.join();
  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }
  return PrecomputedTable{std::move(rows)};
}

} // namespace vdot
