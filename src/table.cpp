#include <vdot/table.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace vdot {

std::optional<int> grid_index(double score) {
  if (!std::isfinite(score) || std::fabs(score) > 1e6) return std::nullopt;
  return static_cast<int>(std::lround(score * 10.0));
}

PrecomputedTable::PrecomputedTable(std::vector<EquivalenceRow> rows)
  : rows_(std::move(rows)) {
  std::sort(rows_.begin(), rows_.end(),
            [](const EquivalenceRow& a, const EquivalenceRow& b){ return a.v < b.v; });
  for (std::size_t i = 1; i < rows_.size(); ++i) {
    const int prev = rows_[i-1].v;
    const int cur  = rows_[i].v;
    if (cur == prev) {
      throw TableError("duplicate grid index " + std::to_string(cur));
    }
    if (cur != prev + 1) {
      throw TableError("gap in grid between " + std::to_string(prev) +
                       " and " + std::to_string(cur));
    }
  }
}

std::optional<EquivalenceRow> PrecomputedTable::lookup(double score) const {
  const auto v = grid_index(score);
  if (!v) return std::nullopt;
  return at_index(*v);
}

std::optional<EquivalenceRow> PrecomputedTable::at_index(int v) const {
  if (rows_.empty() || v < first_index() || v > last_index()) return std::nullopt;
  return rows_[static_cast<std::size_t>(v - first_index())];
}

} // namespace vdot
