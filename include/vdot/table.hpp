#pragma once
#include <array>
#include <optional>
#include <stdexcept>
#include <vector>
#include <vdot/race.hpp>

namespace vdot {

// Grid bounds: score 30.0 .. 85.0 stored as round(score * 10).
inline constexpr int kFirstIndex = 300;
inline constexpr int kLastIndex  = 850;

// Malformed or inconsistent table data. Fatal for the embedded asset.
class TableError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct EquivalenceRow {
  int v = 0;                                // grid index, round(score * 10)
  std::array<int, kRaceCount> race_s{};     // seconds: 5K, 10K, HM, M
  int easy_slow = 0;                        // paces in seconds per km
  int easy_fast = 0;
  int marathon = 0;
  int threshold = 0;
  int interval = 0;
  int repetition = 0;

  double score() const { return v / 10.0; }

  bool operator==(const EquivalenceRow&) const = default;
};

// round(score * 10); nullopt for non-finite or absurd scores.
std::optional<int> grid_index(double score);

// Immutable mapping grid index -> row over a contiguous index range.
class PrecomputedTable {
public:
  PrecomputedTable() = default;

  // Rows may arrive in any order; keys must be unique and contiguous.
  // Throws TableError otherwise.
  explicit PrecomputedTable(std::vector<EquivalenceRow> rows);

  // Exact-key lookup after rounding to the 0.1 grid. No interpolation.
  std::optional<EquivalenceRow> lookup(double score) const;
  std::optional<EquivalenceRow> at_index(int v) const;

  const std::vector<EquivalenceRow>& rows() const { return rows_; }
  std::size_t size() const { return rows_.size(); }
  bool empty() const { return rows_.empty(); }
  int first_index() const { return rows_.empty() ? 0 : rows_.front().v; }
  int last_index() const { return rows_.empty() ? -1 : rows_.back().v; }

  bool operator==(const PrecomputedTable&) const = default;

private:
  std::vector<EquivalenceRow> rows_;
};

} // namespace vdot
