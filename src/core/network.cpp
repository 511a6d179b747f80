#include "tempest/core/network.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

#include "tempest/core/errors.h"

namespace tempest {
namespace {

struct LayerShape {
  int rows{0};
  int cols{0};
};

LayerShape checked_shape(const Matrix& m, const char* layer) {
  if (m.empty() || m.front().empty()) {
    throw ConfigurationError(std::string(layer) + " matrix is empty");
  }
  const std::size_t cols = m.front().size();
  for (std::size_t i = 0; i < m.size(); ++i) {
    if (m[i].size() != cols) {
      throw ConfigurationError(std::string(layer) + " matrix is not rectangular (row " + std::to_string(i) +
                               " has " + std::to_string(m[i].size()) + " columns, expected " +
                               std::to_string(cols) + ")");
    }
    for (double w : m[i]) {
      if (!std::isfinite(w) || w < 0.0) {
        throw ConfigurationError(std::string(layer) + " matrix has a negative or non-finite weight in row " +
                                 std::to_string(i));
      }
    }
  }
  return {static_cast<int>(m.size()), static_cast<int>(cols)};
}

// Zero-pads m up to rows x cols.
Matrix padded(const Matrix& m, int rows, int cols) {
  Matrix out(static_cast<std::size_t>(rows), std::vector<double>(static_cast<std::size_t>(cols), 0.0));
  for (std::size_t i = 0; i < m.size(); ++i) {
    std::copy(m[i].begin(), m[i].end(), out[i].begin());
  }
  return out;
}

// One mutualistic layer after padding, with the derived per-entity data the
// competition and mutualism terms need.
struct Layer {
  Matrix w;
  double strength{0.0};
  std::vector<bool> plant_active;
  std::vector<bool> animal_active;
  std::vector<double> row_sum;
  std::vector<double> col_sum;
  int active_plants{0};
  int active_animals{0};
};

Layer make_layer(const Matrix& raw, int np, int na, double strength) {
  Layer l;
  l.w = padded(raw, np, na);
  l.strength = strength;
  l.plant_active.assign(static_cast<std::size_t>(np), false);
  l.animal_active.assign(static_cast<std::size_t>(na), false);
  l.row_sum.assign(static_cast<std::size_t>(np), 0.0);
  l.col_sum.assign(static_cast<std::size_t>(na), 0.0);

  for (int i = 0; i < np; ++i) {
    for (int j = 0; j < na; ++j) {
      const double w = l.w[i][j];
      l.row_sum[i] += w;
      l.col_sum[j] += w;
      if (w > 0.0) {
        l.plant_active[i] = true;
        l.animal_active[j] = true;
      }
    }
  }
  l.active_plants = static_cast<int>(std::count(l.plant_active.begin(), l.plant_active.end(), true));
  l.active_animals = static_cast<int>(std::count(l.animal_active.begin(), l.animal_active.end(), true));
  return l;
}

// Within-guild competition among entities active in this layer. `offset` places
// the guild in the flat species space.
void add_competition(Matrix& y, const std::vector<bool>& active, int active_count, int offset, double c) {
  const double per_pair = c / static_cast<double>(std::max(active_count - 1, 1));
  const int n = static_cast<int>(active.size());
  for (int i = 0; i < n; ++i) {
    if (!active[i]) continue;
    for (int j = 0; j < n; ++j) {
      if (i != j && active[j]) y[offset + i][offset + j] += per_pair;
    }
  }
}

// Bidirectional mutualism for every positive edge, normalized by the square root
// of the partner's degree within the layer.
void add_mutualism(Matrix& y, const Layer& l, int np) {
  const int na = static_cast<int>(l.col_sum.size());
  for (int i = 0; i < np; ++i) {
    for (int j = 0; j < na; ++j) {
      const double w = l.w[i][j];
      if (w <= 0.0) continue;
      if (l.row_sum[i] > 0.0) y[i][np + j] += l.strength * w / std::sqrt(l.row_sum[i]);
      if (l.col_sum[j] > 0.0) y[np + j][i] += l.strength * w / std::sqrt(l.col_sum[j]);
    }
  }
}

int count_links(const Matrix& m) {
  int n = 0;
  for (const auto& row : m) n += static_cast<int>(std::count_if(row.begin(), row.end(), [](double v) { return v > 0.0; }));
  return n;
}

} // namespace

void split_by_sign(const Matrix& y, Matrix& y_mut, Matrix& y_comp) {
  y_mut = y;
  y_comp = y;
  for (std::size_t i = 0; i < y.size(); ++i) {
    for (std::size_t j = 0; j < y[i].size(); ++j) {
      y_mut[i][j] = std::max(0.0, y[i][j]);
      y_comp[i][j] = std::min(0.0, y[i][j]);
    }
  }
}

InteractionMatrices build_interaction_matrices(const BipartiteNetwork& network, const NetworkParams& params) {
  if (!network.pollination && !network.dispersal) {
    throw ConfigurationError("At least one biadjacency matrix (pollination or dispersal) must be provided");
  }

  int np = 0;
  int na = 0;
  if (network.pollination) {
    const LayerShape s = checked_shape(*network.pollination, "Pollination");
    np = std::max(np, s.rows);
    na = std::max(na, s.cols);
  }
  if (network.dispersal) {
    const LayerShape s = checked_shape(*network.dispersal, "Dispersal");
    np = std::max(np, s.rows);
    na = std::max(na, s.cols);
  }

  std::vector<Layer> layers;
  if (network.pollination) layers.push_back(make_layer(*network.pollination, np, na, params.m));
  if (network.dispersal) layers.push_back(make_layer(*network.dispersal, np, na, params.d));

  const int nt = np + na;
  Matrix y(static_cast<std::size_t>(nt), std::vector<double>(static_cast<std::size_t>(nt), 0.0));

  // Competition and mutualism share one signed accumulator. Competition only
  // touches same-guild cells and mutualism only cross-guild cells, so the sign
  // split below never merges the two.
  for (const auto& l : layers) {
    add_competition(y, l.plant_active, l.active_plants, 0, params.c);
    add_competition(y, l.animal_active, l.active_animals, np, params.c);
  }
  for (const auto& l : layers) add_mutualism(y, l, np);

  InteractionMatrices out;
  split_by_sign(y, out.y_mut, out.y_comp);
  out.n_plants = np;
  out.n_animals = na;
  return out;
}

InteractionMatrices build_ring_matrices(int n_species, double m, double c) {
  if (n_species < 1) {
    throw ConfigurationError("Ring network needs at least one species (got " + std::to_string(n_species) + ")");
  }
  const auto n = static_cast<std::size_t>(n_species);
  Matrix y(n, std::vector<double>(n, 0.0));
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = 0; j < n; ++j) {
      if (i == j) continue;
      const bool ring_edge = (i + 1) % n == j || (j + 1) % n == i;
      y[i][j] = ring_edge ? m : c;
    }
  }

  InteractionMatrices out;
  split_by_sign(y, out.y_mut, out.y_comp);
  return out;
}

NetworkStats network_stats(const BipartiteNetwork& network) {
  NetworkStats st;
  for (const auto* layer : {&network.pollination, &network.dispersal}) {
    if (!*layer || (*layer)->empty()) continue;
    st.n_plants = std::max(st.n_plants, static_cast<int>((*layer)->size()));
    st.n_animals = std::max(st.n_animals, static_cast<int>((*layer)->front().size()));
  }
  if (network.pollination) st.n_pollination_links = count_links(*network.pollination);
  if (network.dispersal) st.n_dispersal_links = count_links(*network.dispersal);
  st.n_total = st.n_plants + st.n_animals;
  return st;
}

BipartiteNetwork default_network() {
  constexpr int kPlants = 3;
  constexpr int kAnimals = 6;
  Matrix b(kPlants, std::vector<double>(kAnimals, 0.0));
  Matrix s(kPlants, std::vector<double>(kAnimals, 0.0));

  // Pollinators: each plant shares one pollinator with each other plant.
  b[0][0] = 1.0;
  b[0][1] = 1.0;
  b[1][1] = 1.0;
  b[1][2] = 1.0;
  b[2][0] = 1.0;
  b[2][2] = 1.0;

  // Seed dispersers, same pattern on columns 3-5.
  s[0][3] = 1.0;
  s[0][4] = 1.0;
  s[1][4] = 1.0;
  s[1][5] = 1.0;
  s[2][3] = 1.0;
  s[2][5] = 1.0;

  BipartiteNetwork net;
  net.pollination = std::move(b);
  net.dispersal = std::move(s);
  return net;
}

std::string species_label(int index, int n_plants, int n_animals) {
  if (n_plants + n_animals == 0) return "species_" + std::to_string(index);
  if (index < n_plants) return "plant_" + std::to_string(index);
  return "animal_" + std::to_string(index - n_plants);
}

std::vector<std::string> species_labels(const InteractionMatrices& m) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(m.n_species()));
  for (int i = 0; i < m.n_species(); ++i) out.push_back(species_label(i, m.n_plants, m.n_animals));
  return out;
}

} // namespace tempest
