#pragma once
#include <cmath>
#include <limits>
#include <optional>

namespace vdot {

struct BisectOptions {
  double xtol = 2e-12;                                        // absolute
  double rtol = 4.0 * std::numeric_limits<double>::epsilon(); // relative
  int max_iter = 100;
};

// Bracketed bisection for a continuous f on [lo, hi].
// Returns nullopt when f(lo) and f(hi) share a sign (no root in bracket),
// when an endpoint evaluates to a non-finite value, or when max_iter halvings
// do not reach the tolerance. Stateless; safe to call from any thread.
template <class F>
std::optional<double> bisect(F&& f, double lo, double hi, const BisectOptions& opt = {}) {
  const double flo = f(lo);
  const double fhi = f(hi);
  if (!std::isfinite(flo) || !std::isfinite(fhi)) return std::nullopt;
  if (flo * fhi > 0.0) return std::nullopt;
  if (flo == 0.0) return lo;
  if (fhi == 0.0) return hi;

  // Walk from lo, keeping f(lo) sign; halve the step each round.
  double a = lo;
  double dm = hi - lo;
  for (int i = 0; i < opt.max_iter; ++i) {
    dm *= 0.5;
    const double xm = a + dm;
    const double fm = f(xm);
    if (fm * flo >= 0.0) a = xm;
    if (fm == 0.0 || std::fabs(dm) < opt.xtol + opt.rtol * std::fabs(xm)) return xm;
  }
  return std::nullopt;
}

} // namespace vdot
