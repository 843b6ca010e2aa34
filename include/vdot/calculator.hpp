#pragma once
#include <optional>
#include <vdot/model.hpp>
#include <vdot/race.hpp>
#include <vdot/table.hpp>

namespace vdot {

// Effort fractions behind the stored training paces.
inline constexpr double kEasySlowEffort  = 0.6304;
inline constexpr double kEasyFastEffort  = 0.7346;
inline constexpr double kThresholdEffort = 0.8799;
inline constexpr double kIntervalEffort  = 0.9743;

// Repetition pace = interval pace minus this offset (s/km).
inline int repetition_offset(double score) { return score < 50.0 ? 20 : 15; }

struct Performance {
  double distance_m = 0.0;
  double duration_s = 0.0;
};

struct Evaluation {
  std::optional<double> score;          // raw forward score
  std::optional<double> rounded_score;  // one decimal, as displayed
  std::optional<EquivalenceRow> row;    // nullopt -> unavailable
  bool from_table = false;
};

struct PaceRange {
  double slower = 0.0;  // s/km
  double faster = 0.0;  // s/km
};

// Unrounded equivalent race time in seconds, nullopt when no root exists.
std::optional<double> equivalent_race_seconds(double score, double distance_m,
                                              Bracket bracket = kRaceBracket);

// Full row for an arbitrary score, computed the same way the generator
// computes each grid row. Keyed by round(score * 10).
std::optional<EquivalenceRow> equivalence_row(double score,
                                              Bracket bracket = kRaceBracket);

// Input -> derived output. With a table, rows come from an exact-key lookup
// (unavailable outside the table); without one they are computed live.
Evaluation evaluate(const Performance& p, const PrecomputedTable* table = nullptr);
Evaluation evaluate_score(double score, const PrecomputedTable* table = nullptr);

// Live pace range for a training zone, using the zone's effort band.
PaceRange training_pace_range(double score, Zone zone);

double round_to_tenth(double score);

} // namespace vdot
