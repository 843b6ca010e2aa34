#include <vdot/model.hpp>
#include <vdot/solver.hpp>
#include <cmath>

namespace vdot {

double oxygen_cost(double v) {
  return -4.6 + 0.182258 * v + 0.000104 * v * v;
}

double fraction_sustained(double t) {
  return 0.8
       + 0.1894393 * std::exp(-0.012778 * t)
       + 0.2989558 * std::exp(-0.1932605 * t);
}

double race_time_residual(double x, double score, double d) {
  // oxygen_cost(d / x) / fraction_sustained(x) - score, in the d/x form.
  const double vo2 = -4.6 + 0.182258 * d / x + 0.000104 * d * d / (x * x);
  return vo2 / fraction_sustained(x) - score;
}

double pace_from_effort(double score, double effort) {
  return (-0.182258 + std::sqrt(0.033218 - 0.000416 * (-4.6 - score * effort))) / 0.000208;
}

std::optional<double> vdot_from_performance(double distance_m, double duration_s) {
  if (!(distance_m > 0.0) || !(duration_s > 0.0)) return std::nullopt;
  const double t = duration_s / 60.0;
  const double v = distance_m / t;
  return oxygen_cost(v) / fraction_sustained(t);
}

std::optional<double> race_minutes(double score, double distance_m, Bracket bracket) {
  return bisect([score, distance_m](double x) {
                  return race_time_residual(x, score, distance_m);
                },
                bracket.lo, bracket.hi);
}

} // namespace vdot
