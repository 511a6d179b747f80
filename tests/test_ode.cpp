#include <cmath>
#include <iostream>
#include <stdexcept>

#include "tempest/core/ode.h"

#define TEMPEST_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_ode() {
  using tempest::StateVector;

  const tempest::VectorField decay = [](double, const StateVector& y) {
    StateVector dy(y.size());
    for (std::size_t i = 0; i < y.size(); ++i) dy[i] = -y[i];
    return dy;
  };

  // Exponential decay over [0, 1] with dt = 0.01.
  {
    const auto out = tempest::solve_ode(decay, {1.0, 2.0}, 0.0, 1.0, 0.01);
    TEMPEST_ASSERT(out.size() == 101);
    TEMPEST_ASSERT(out.front().t == 0.0);
    TEMPEST_ASSERT(out.back().t == 1.0);
    TEMPEST_ASSERT(std::fabs(out.back().y[0] - std::exp(-1.0)) < 1e-6);
    TEMPEST_ASSERT(std::fabs(out.back().y[1] - 2.0 * std::exp(-1.0)) < 1e-6);

    for (std::size_t k = 1; k < out.size(); ++k) TEMPEST_ASSERT(out[k].t > out[k - 1].t);
  }

  // A partial final step lands exactly on t1.
  {
    const auto out = tempest::solve_ode(decay, {1.0}, 0.0, 0.025, 0.01);
    TEMPEST_ASSERT(out.size() == 4);
    TEMPEST_ASSERT(out.back().t == 0.025);
    TEMPEST_ASSERT(std::fabs(out.back().y[0] - std::exp(-0.025)) < 1e-9);
  }

  // A remainder that differs from dt only by rounding is one final step, not a
  // full step followed by a near-zero one.
  {
    const auto out = tempest::solve_ode(decay, {1.0}, 0.0, 0.03, 0.01);
    TEMPEST_ASSERT(out.size() == 4);
    TEMPEST_ASSERT(out.back().t == 0.03);
    TEMPEST_ASSERT(out[3].t - out[2].t > 0.005);

    const auto shifted = tempest::solve_ode(decay, {1.0}, 0.1, 0.1 + 3 * 0.01, 0.01);
    TEMPEST_ASSERT(shifted.size() == 4);
  }

  // Empty or reversed intervals only return the initial sample.
  {
    const auto same = tempest::solve_ode(decay, {1.0}, 3.0, 3.0, 0.01);
    TEMPEST_ASSERT(same.size() == 1);
    TEMPEST_ASSERT(same[0].t == 3.0);
    TEMPEST_ASSERT(same[0].y[0] == 1.0);

    const auto back = tempest::solve_ode(decay, {1.0}, 3.0, 2.0, 0.01);
    TEMPEST_ASSERT(back.size() == 1);

    // No interval: an invalid dt is never looked at.
    TEMPEST_ASSERT(tempest::solve_ode(decay, {1.0}, 1.0, 1.0, 0.0).size() == 1);
  }

  // Invalid step sizes.
  {
    bool threw = false;
    try {
      (void)tempest::solve_ode(decay, {1.0}, 0.0, 1.0, 0.0);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    TEMPEST_ASSERT(threw);

    threw = false;
    try {
      (void)tempest::solve_ode(decay, {1.0}, 0.0, 1.0, -0.5);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    TEMPEST_ASSERT(threw);
  }

  // Single RK4 step on a linear field matches the 4th order Taylor polynomial.
  {
    const double h = 0.1;
    const StateVector y1 = tempest::rk4_step(decay, 0.0, {1.0}, h);
    const double taylor = 1.0 - h + h * h / 2.0 - h * h * h / 6.0 + h * h * h * h / 24.0;
    TEMPEST_ASSERT(std::fabs(y1[0] - taylor) < 1e-14);
  }

  // Deterministic.
  {
    const auto a = tempest::solve_ode(decay, {0.7}, 0.0, 2.0, 0.05);
    const auto b = tempest::solve_ode(decay, {0.7}, 0.0, 2.0, 0.05);
    TEMPEST_ASSERT(a.size() == b.size());
    for (std::size_t k = 0; k < a.size(); ++k) {
      TEMPEST_ASSERT(a[k].t == b[k].t);
      TEMPEST_ASSERT(a[k].y == b[k].y);
    }
  }

  return 0;
}
