#include <vdot/calculator.hpp>
#include <cmath>

namespace vdot {

static std::optional<int> pace_seconds(double score, double effort) {
  const double vel = pace_from_effort(score, effort);
  if (!std::isfinite(vel) || vel <= 0.0) return std::nullopt;
  return static_cast<int>(std::lround(seconds_per_km(vel)));
}

std::optional<double> equivalent_race_seconds(double score, double distance_m, Bracket bracket) {
  const auto minutes = race_minutes(score, distance_m, bracket);
  if (!minutes) return std::nullopt;
  return *minutes * 60.0;
}

std::optional<EquivalenceRow> equivalence_row(double score, Bracket bracket) {
  const auto v = grid_index(score);
  if (!v) return std::nullopt;

  EquivalenceRow row{};
  row.v = *v;
  for (std::size_t i = 0; i < kRaceCount; ++i) {
    const auto secs = equivalent_race_seconds(score, kRaceDistances[i], bracket);
    if (!secs) return std::nullopt;
    row.race_s[i] = static_cast<int>(std::lround(*secs));
  }

  const auto e1 = pace_seconds(score, kEasySlowEffort);
  const auto e2 = pace_seconds(score, kEasyFastEffort);
  const auto t  = pace_seconds(score, kThresholdEffort);
  const auto iv = pace_seconds(score, kIntervalEffort);
  if (!e1 || !e2 || !t || !iv) return std::nullopt;

  row.easy_slow  = *e1;
  row.easy_fast  = *e2;
  row.marathon   = static_cast<int>(std::lround(row.race_s[kRaceCount - 1] / kMarathonKm));
  row.threshold  = *t;
  row.interval   = *iv;
  // Offset follows the grid key so a live row matches the stored row it rounds to.
  row.repetition = *iv - repetition_offset(row.score());
  return row;
}

double round_to_tenth(double score) {
  return std::round(score * 10.0) / 10.0;
}

Evaluation evaluate_score(double score, const PrecomputedTable* table) {
  Evaluation out{};
  if (!std::isfinite(score)) return out;
  out.score = score;
  out.rounded_score = round_to_tenth(score);

  if (table) {
    out.row = table->lookup(score);
    out.from_table = out.row.has_value();
  } else {
    out.row = equivalence_row(score);
  }
  return out;
}

Evaluation evaluate(const Performance& p, const PrecomputedTable* table) {
  const auto score = vdot_from_performance(p.distance_m, p.duration_s);
  if (!score) return Evaluation{};
  return evaluate_score(*score, table);
}

PaceRange training_pace_range(double score, Zone zone) {
  for (const auto& b : zone_catalog()) {
    if (b.zone != zone) continue;
    return PaceRange{seconds_per_km(pace_from_effort(score, b.effort_lo)),
                     seconds_per_km(pace_from_effort(score, b.effort_hi))};
  }
  return PaceRange{};
}

} // namespace vdot
