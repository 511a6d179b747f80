#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tempest {

// Row-major dense matrix. For interaction matrices, row i holds the effects of
// every species on species i.
using Matrix = std::vector<std::vector<double>>;

// Two-layer plant/animal network. Rows are plants, columns animals.
// Either layer may be absent, but not both.
struct BipartiteNetwork {
  std::optional<Matrix> pollination; // B
  std::optional<Matrix> dispersal;   // S
};

struct NetworkParams {
  double m{0.5};  // pollination mutualism strength
  double d{0.5};  // seed dispersal mutualism strength
  double c{-0.1}; // competition strength (signed; negative is competitive)
};

// Signed interaction matrices over the flat species space.
//
// Species [0, n_plants) are plants, [n_plants, n_plants + n_animals) animals.
// For the synthetic ring network n_plants == n_animals == 0 and the species count
// comes from the matrix size.
struct InteractionMatrices {
  Matrix y_mut;  // >= 0
  Matrix y_comp; // <= 0
  int n_plants{0};
  int n_animals{0};

  int n_species() const { return static_cast<int>(y_mut.size()); }
};

// Builds interaction matrices from a bipartite network (see DESIGN.md for the
// degree normalization). Throws ConfigurationError when no layer is given or a
// layer is empty, ragged, or has negative / non-finite weights.
InteractionMatrices build_interaction_matrices(const BipartiteNetwork& network, const NetworkParams& params);

// Synthetic ring: species i and (i + 1) mod n are mutualists with strength m,
// every other off-diagonal pair competes with strength c. No normalization.
// Throws ConfigurationError if n_species < 1.
InteractionMatrices build_ring_matrices(int n_species, double m, double c);

// Splits a combined signed matrix into its non-negative and non-positive parts.
void split_by_sign(const Matrix& y, Matrix& y_mut, Matrix& y_comp);

struct NetworkStats {
  int n_plants{0};
  int n_animals{0};
  int n_total{0};
  int n_pollination_links{0};
  int n_dispersal_links{0};
};

NetworkStats network_stats(const BipartiteNetwork& network);

// Built-in demo network: 3 plants, 3 pollinators (columns 0-2) and
// 3 seed dispersers (columns 3-5).
BipartiteNetwork default_network();

// "plant_<k>" / "animal_<k>", or "species_<k>" when n_plants == 0 and the
// species space has no plant/animal split.
std::string species_label(int index, int n_plants, int n_animals);
std::vector<std::string> species_labels(const InteractionMatrices& m);

} // namespace tempest
