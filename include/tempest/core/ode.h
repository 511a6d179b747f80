#pragma once

#include <functional>
#include <vector>

namespace tempest {

using StateVector = std::vector<double>;

// One point of a trajectory.
struct OdeSample {
  double t{0.0};
  StateVector y;
};

// dy/dt = f(t, y). Model parameters are bound into the callable by the caller
// (see make_vector_field in ecology.h).
using VectorField = std::function<StateVector(double, const StateVector&)>;

// Classical four-stage Runge-Kutta step of size dt.
StateVector rk4_step(const VectorField& f, double t, const StateVector& y, double dt);

// Integrate from t0 to t1 with fixed steps of dt. The last step is shortened so
// the final sample lands exactly on t1. A remainder exceeding dt by at most
// 1e-9 * dt (rounding on the t0 + k * dt grid) is taken as one slightly longer
// final step instead of a full step plus a near-zero one.
//
// The returned trajectory always starts with {t0, y0}. When t1 <= t0 that is the
// only sample. Throws std::invalid_argument if dt <= 0 (or non-finite) and t1 > t0.
std::vector<OdeSample> solve_ode(const VectorField& f, const StateVector& y0, double t0, double t1,
                                 double dt);

} // namespace tempest
