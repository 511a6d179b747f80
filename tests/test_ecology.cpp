#include <cmath>
#include <iostream>

#include "tempest/core/ecology.h"
#include "tempest/core/errors.h"

#define TEMPEST_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

tempest::EcologyParams two_species() {
  tempest::EcologyParams p;
  p.y_mut = {{0.0, 1.0}, {1.0, 0.0}};
  p.y_comp = {{0.0, -0.1}, {-0.1, 0.0}};
  p.r = {0.2, 0.3};
  p.h = {0.5, 0.5};
  return p;
}

bool near(double a, double b, double eps = 1e-12) { return std::fabs(a - b) <= eps; }

} // namespace

int test_ecology() {
  // Type II response, term by term.
  {
    const auto p = two_species();
    const auto dn = tempest::type2_derivative(0.0, {1.0, 2.0}, p);
    TEMPEST_ASSERT(dn.size() == 2);

    // species 0: x = 2, M = 2 / (1 + 0.5 * 2) = 1, competition = -0.2
    TEMPEST_ASSERT(near(dn[0], 1.0 * (0.2 - 1.0 - 0.2 + 1.0)));
    // species 1: x = 1, M = 1 / 1.5, competition = -0.1
    TEMPEST_ASSERT(near(dn[1], 2.0 * (0.3 - 2.0 - 0.1 + 1.0 / 1.5)));
  }

  // h = 0 degenerates to a linear (Type I) response.
  {
    auto p = two_species();
    p.h = {0.0, 0.0};
    const auto dn = tempest::type2_derivative(0.0, {0.5, 0.5}, p);
    TEMPEST_ASSERT(near(dn[0], 0.5 * (0.2 - 0.5 - 0.05 + 0.5)));
  }

  // Zero (and negative) populations are absorbing.
  {
    const auto p = two_species();
    const auto dn = tempest::type2_derivative(0.0, {0.0, 1.0}, p);
    TEMPEST_ASSERT(dn[0] == 0.0);
    TEMPEST_ASSERT(dn[1] != 0.0);

    const auto neg = tempest::type2_derivative(0.0, {-0.1, 0.0}, p);
    TEMPEST_ASSERT(neg[0] == 0.0);
    TEMPEST_ASSERT(neg[1] == 0.0);
  }

  // The bound vector field owns a copy of the parameters.
  {
    tempest::VectorField f;
    {
      auto p = two_species();
      f = tempest::make_vector_field(p);
      p.r = {100.0, 100.0};
    }
    const auto direct = tempest::type2_derivative(0.0, {1.0, 2.0}, two_species());
    TEMPEST_ASSERT(f(0.0, {1.0, 2.0}) == direct);
  }

  // Parameter validation.
  {
    auto p = two_species();
    p.h = {0.5};
    bool threw = false;
    try {
      tempest::validate_params(p);
    } catch (const tempest::ConfigurationError&) {
      threw = true;
    }
    TEMPEST_ASSERT(threw);

    p = two_species();
    p.h = {0.5, -1.0};
    threw = false;
    try {
      tempest::validate_params(p);
    } catch (const tempest::ConfigurationError&) {
      threw = true;
    }
    TEMPEST_ASSERT(threw);

    p = two_species();
    p.y_comp = {{0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}};
    threw = false;
    try {
      tempest::validate_params(p);
    } catch (const tempest::ConfigurationError&) {
      threw = true;
    }
    TEMPEST_ASSERT(threw);

    tempest::validate_params(two_species());
    TEMPEST_ASSERT(tempest::species_count(two_species()) == 2);
  }

  // Random initialization ranges and seeding.
  {
    tempest::util::SplitMixRng rng(123);
    const auto r = tempest::initialize_growth_rates(200, rng);
    const auto n0 = tempest::initialize_populations(200, rng);
    TEMPEST_ASSERT(r.size() == 200 && n0.size() == 200);
    for (double v : r) TEMPEST_ASSERT(v >= tempest::kGrowthRateMin && v < tempest::kGrowthRateMax);
    for (double v : n0) TEMPEST_ASSERT(v >= tempest::kInitialPopulationMin && v < tempest::kInitialPopulationMax);
    TEMPEST_ASSERT(tempest::initialize_populations(0, rng).empty());
  }

  // create_ecology_params draws growth rates before populations.
  {
    tempest::InteractionMatrices m;
    m.y_mut = {{0.0, 0.5}, {0.5, 0.0}};
    m.y_comp = {{0.0, 0.0}, {0.0, 0.0}};
    m.n_plants = 1;
    m.n_animals = 1;

    tempest::util::SplitMixRng a(9);
    const auto setup = tempest::create_ecology_params(m, 0.25, a);
    TEMPEST_ASSERT(setup.params.h == std::vector<double>({0.25, 0.25}));
    TEMPEST_ASSERT(setup.params.y_mut == m.y_mut);

    tempest::util::SplitMixRng b(9);
    const auto r = tempest::initialize_growth_rates(2, b);
    const auto n0 = tempest::initialize_populations(2, b);
    TEMPEST_ASSERT(setup.params.r == r);
    TEMPEST_ASSERT(setup.initial_population == n0);
  }

  return 0;
}
