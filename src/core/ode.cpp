#include "tempest/core/ode.h"

#include <cmath>
#include <cstddef>
#include <stdexcept>

#include <boost/numeric/odeint/stepper/runge_kutta4.hpp>

namespace tempest {
namespace {

namespace odeint = boost::numeric::odeint;

using Rk4Stepper = odeint::runge_kutta4<StateVector>;

// Adapts a VectorField to odeint's system signature.
struct OdeintSystem {
  const VectorField& f;
  void operator()(const StateVector& x, StateVector& dxdt, double t) const { dxdt = f(t, x); }
};

} // namespace

StateVector rk4_step(const VectorField& f, double t, const StateVector& y, double dt) {
  Rk4Stepper stepper;
  StateVector next = y;
  stepper.do_step(OdeintSystem{f}, next, t, dt);
  return next;
}

std::vector<OdeSample> solve_ode(const VectorField& f, const StateVector& y0, double t0, double t1,
                                 double dt) {
  std::vector<OdeSample> out;
  out.push_back({t0, y0});
  if (!(t1 > t0)) return out;

  if (!(dt > 0.0) || !std::isfinite(dt)) {
    throw std::invalid_argument("solve_ode: time step must be positive and finite");
  }

  const double span = t1 - t0;
  out.reserve(static_cast<std::size_t>(std::ceil(span / dt)) + 1);

  // Grid times are t0 + k * dt rather than a running sum, so they do not drift.
  // A remainder within a rounding error of dt is taken as the final step.
  const double slack = dt * 1e-9;

  Rk4Stepper stepper;
  double t = t0;
  StateVector y = y0;
  for (std::size_t k = 1; t < t1; ++k) {
    const double remaining = t1 - t;
    const bool last = remaining <= dt + slack;
    const double h = last ? remaining : dt;
    stepper.do_step(OdeintSystem{f}, y, t, h);
    t = last ? t1 : t0 + static_cast<double>(k) * dt;
    out.push_back({t, y});
  }
  return out;
}

} // namespace tempest
