#pragma once
#include <optional>

namespace vdot {

// Bracket (minutes) searched for a race duration.
struct Bracket {
  double lo = 1.0;
  double hi = 600.0;
};

inline constexpr Bracket kRaceBracket{1.0, 600.0};

// Oxygen cost (ml/kg/min) of running at velocity v (m/min).
double oxygen_cost(double velocity_m_per_min);

// Fraction of VO2max sustainable for t minutes.
double fraction_sustained(double minutes);

// Deviation of the score implied by finishing `distance_m` in `x` minutes
// from `score`. Zero at the equivalent race duration.
double race_time_residual(double x, double score, double distance_m);

// Velocity (m/min) sustained at `effort` (fraction of VO2max) for `score`.
double pace_from_effort(double score, double effort);

// Forward direction: score from a performance. nullopt if distance or
// duration is not positive.
std::optional<double> vdot_from_performance(double distance_m, double duration_s);

// Inverse direction: race duration (minutes) consistent with `score`.
// nullopt when the bracket holds no sign change.
std::optional<double> race_minutes(double score, double distance_m,
                                   Bracket bracket = kRaceBracket);

// m/min -> s/km
inline double seconds_per_km(double velocity_m_per_min) {
  return 1000.0 / velocity_m_per_min * 60.0;
}

} // namespace vdot
