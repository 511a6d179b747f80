#include "tempest/core/ecology.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

#include "tempest/core/errors.h"

namespace tempest {
namespace {

void check_square(const Matrix& m, std::size_t n, const char* name) {
  if (m.size() != n) {
    throw ConfigurationError(std::string(name) + " has " + std::to_string(m.size()) + " rows, expected " +
                             std::to_string(n));
  }
  for (const auto& row : m) {
    if (row.size() != n) throw ConfigurationError(std::string(name) + " is not " + std::to_string(n) + "x" + std::to_string(n));
  }
}

} // namespace

int species_count(const EcologyParams& params) { return static_cast<int>(params.r.size()); }

void validate_params(const EcologyParams& params) {
  const std::size_t n = params.r.size();
  if (n == 0) throw ConfigurationError("Ecology parameters describe zero species");
  if (params.h.size() != n) {
    throw ConfigurationError("Half-saturation vector has " + std::to_string(params.h.size()) +
                             " entries, expected " + std::to_string(n));
  }
  check_square(params.y_mut, n, "Mutualistic matrix");
  check_square(params.y_comp, n, "Competition matrix");
  for (double h : params.h) {
    if (!std::isfinite(h) || h < 0.0) throw ConfigurationError("Half-saturation constants must be finite and >= 0");
  }
}

StateVector type2_derivative(double /*t*/, const StateVector& n, const EcologyParams& params) {
  const std::size_t count = n.size();
  StateVector dn(count, 0.0);

  for (std::size_t i = 0; i < count; ++i) {
    if (n[i] <= 0.0) continue;

    double mut_raw = 0.0;
    double comp = 0.0;
    const auto& mut_row = params.y_mut[i];
    const auto& comp_row = params.y_comp[i];
    for (std::size_t j = 0; j < count; ++j) {
      mut_raw += mut_row[j] * n[j];
      comp += comp_row[j] * n[j];
    }
    const double m = mut_raw / (1.0 + params.h[i] * mut_raw);
    dn[i] = n[i] * (params.r[i] - n[i] + comp + m);
  }
  return dn;
}

VectorField make_vector_field(EcologyParams params) {
  return [p = std::move(params)](double t, const StateVector& y) { return type2_derivative(t, y, p); };
}

std::vector<double> initialize_growth_rates(int n_species, util::SplitMixRng& rng) {
  std::vector<double> r;
  r.reserve(static_cast<std::size_t>(std::max(n_species, 0)));
  for (int i = 0; i < n_species; ++i) r.push_back(rng.uniform(kGrowthRateMin, kGrowthRateMax));
  return r;
}

StateVector initialize_populations(int n_species, util::SplitMixRng& rng) {
  StateVector n;
  n.reserve(static_cast<std::size_t>(std::max(n_species, 0)));
  for (int i = 0; i < n_species; ++i) n.push_back(rng.uniform(kInitialPopulationMin, kInitialPopulationMax));
  return n;
}

EcologySetup create_ecology_params(const InteractionMatrices& matrices, double half_saturation,
                                   util::SplitMixRng& rng) {
  const int n = matrices.n_species();

  EcologySetup out;
  out.params.y_mut = matrices.y_mut;
  out.params.y_comp = matrices.y_comp;
  out.params.r = initialize_growth_rates(n, rng);
  out.params.h.assign(static_cast<std::size_t>(n), half_saturation);
  out.initial_population = initialize_populations(n, rng);

  validate_params(out.params);
  return out;
}

} // namespace tempest
