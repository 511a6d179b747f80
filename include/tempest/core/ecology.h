#pragma once

#include <vector>

#include "tempest/core/network.h"
#include "tempest/core/ode.h"
#include "tempest/util/rng.h"

namespace tempest {

// Parameters of the mutualistic Lotka-Volterra model with a Type II response.
//
//   dN[i]/dt = N[i] * (r[i] - N[i] + sum_j Ycomp[i][j] N[j] + M[i])
//   M[i]     = x / (1 + h[i] x),  x = sum_j Ymut[i][j] N[j]
//
// All four members are indexed by the same flat species ordering.
struct EcologyParams {
  Matrix y_mut;
  Matrix y_comp;
  std::vector<double> r; // intrinsic growth rates
  std::vector<double> h; // half-saturation constants
};

// Settings used to derive EcologyParams (the model sliders of the front-end).
struct ModelConfig {
  // Only used for the synthetic ring network.
  int n_species{4};

  double mutualistic_strength{0.5}; // m (pollination layer / ring edges)
  double dispersal_strength{0.5};   // d (seed dispersal layer)
  double competition_strength{-0.1}; // c, signed (negative = competitive)
  double half_saturation{0.5};       // h, broadcast to every species
};

// Growth rates are drawn once per run from [0.1, 0.5).
inline constexpr double kGrowthRateMin = 0.1;
inline constexpr double kGrowthRateMax = 0.5;

// Initial populations are drawn from [0.3, 1.0).
inline constexpr double kInitialPopulationMin = 0.3;
inline constexpr double kInitialPopulationMax = 1.0;

// Number of species described by the parameter bundle (size of r).
int species_count(const EcologyParams& params);

// Throws ConfigurationError if matrix/vector dimensions disagree or a half-saturation
// constant is negative or non-finite.
void validate_params(const EcologyParams& params);

// Time derivative of the population vector. t is unused by the model itself.
//
// Species with N[i] <= 0 get dN[i] = 0, so extinct species can never come back
// through the continuous dynamics.
StateVector type2_derivative(double t, const StateVector& n, const EcologyParams& params);

// Binds params (by value) into a VectorField for the integrator.
VectorField make_vector_field(EcologyParams params);

std::vector<double> initialize_growth_rates(int n_species, util::SplitMixRng& rng);
StateVector initialize_populations(int n_species, util::SplitMixRng& rng);

struct EcologySetup {
  EcologyParams params;
  StateVector initial_population;
};

// Wraps prebuilt interaction matrices with freshly drawn growth rates and initial
// populations. Growth rates are drawn before populations.
EcologySetup create_ecology_params(const InteractionMatrices& matrices, double half_saturation,
                                   util::SplitMixRng& rng);

} // namespace tempest
