#pragma once
#include <optional>
#include <string>
#include <vector>
#include <vdot/table.hpp>

namespace vdot {

// Seconds -> "H:MM:SS" (one hour or more) or "M:SS". Negative -> "-".
std::string format_duration(int seconds);

// Accepts "h:mm:ss" (any number of hour digits) or "m:ss" / "mm:ss";
// minute and second fields must be 00..59. Returns total seconds.
std::optional<int> parse_duration(const std::string& s);

// Score indicator state for front ends.
enum class Indicator { Default, Good, Bad };
Indicator classify(std::optional<double> score);

// "?" when absent, else one decimal.
std::string format_score(std::optional<double> score);

struct DisplayRow {
  std::string label;
  std::string value;  // "-" when unavailable
};

// The row to show for a score: nullopt when classify() reports Bad, so
// implausible scores render as dashes like missing ones.
std::optional<EquivalenceRow> visible_row(std::optional<double> score,
                                          const std::optional<EquivalenceRow>& row);

// One entry per catalog race, in table column order.
std::vector<DisplayRow> race_rows(const std::optional<EquivalenceRow>& row);

// Easy (fast - slow), Marathon, Threshold, Interval, Repetitions.
std::vector<DisplayRow> pace_rows(const std::optional<EquivalenceRow>& row);

} // namespace vdot
