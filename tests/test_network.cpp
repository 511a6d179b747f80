#include <cmath>
#include <iostream>
#include <string>

#include "tempest/core/errors.h"
#include "tempest/core/network.h"

#define TEMPEST_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b, double eps = 1e-12) { return std::fabs(a - b) <= eps; }

bool builds_fail(const tempest::BipartiteNetwork& net) {
  try {
    (void)tempest::build_interaction_matrices(net, tempest::NetworkParams{});
  } catch (const tempest::ConfigurationError&) {
    return true;
  }
  return false;
}

} // namespace

int test_network() {
  using tempest::Matrix;

  // No layer at all, or an unusable one.
  {
    TEMPEST_ASSERT(builds_fail(tempest::BipartiteNetwork{}));

    tempest::BipartiteNetwork empty;
    empty.pollination = Matrix{};
    TEMPEST_ASSERT(builds_fail(empty));

    tempest::BipartiteNetwork ragged;
    ragged.pollination = Matrix{{1.0, 0.0}, {1.0}};
    TEMPEST_ASSERT(builds_fail(ragged));

    tempest::BipartiteNetwork negative;
    negative.dispersal = Matrix{{1.0, -0.5}};
    TEMPEST_ASSERT(builds_fail(negative));
  }

  // Identity pollination, m = 1, no competition.
  {
    tempest::BipartiteNetwork net;
    net.pollination = Matrix{{1.0, 0.0}, {0.0, 1.0}};
    tempest::NetworkParams p;
    p.m = 1.0;
    p.c = 0.0;
    const auto im = tempest::build_interaction_matrices(net, p);

    TEMPEST_ASSERT(im.n_plants == 2);
    TEMPEST_ASSERT(im.n_animals == 2);
    TEMPEST_ASSERT(im.n_species() == 4);
    TEMPEST_ASSERT(im.y_mut[0][2] == 1.0);
    TEMPEST_ASSERT(im.y_mut[2][0] == 1.0);
    TEMPEST_ASSERT(im.y_mut[1][3] == 1.0);
    TEMPEST_ASSERT(im.y_mut[3][1] == 1.0);
    TEMPEST_ASSERT(im.y_mut[0][3] == 0.0);
    for (const auto& row : im.y_comp) {
      for (double v : row) TEMPEST_ASSERT(v == 0.0);
    }
  }

  // Competition divided by (active - 1); mutualism normalized by sqrt(degree).
  {
    tempest::BipartiteNetwork net;
    net.pollination = Matrix{{1.0, 1.0}, {1.0, 0.0}};
    tempest::NetworkParams p;
    p.m = 0.5;
    p.c = -0.1;
    const auto im = tempest::build_interaction_matrices(net, p);

    TEMPEST_ASSERT(near(im.y_comp[0][1], -0.1));
    TEMPEST_ASSERT(near(im.y_comp[1][0], -0.1));
    TEMPEST_ASSERT(near(im.y_comp[2][3], -0.1));
    TEMPEST_ASSERT(im.y_comp[0][2] == 0.0); // no plant-animal competition

    TEMPEST_ASSERT(near(im.y_mut[0][2], 0.5 / std::sqrt(2.0)));
    TEMPEST_ASSERT(near(im.y_mut[0][3], 0.5 / std::sqrt(2.0))); // plant 0 has degree 2
    TEMPEST_ASSERT(near(im.y_mut[1][2], 0.5));
    TEMPEST_ASSERT(near(im.y_mut[2][0], 0.5 / std::sqrt(2.0)));
    TEMPEST_ASSERT(near(im.y_mut[3][0], 0.5));
    TEMPEST_ASSERT(im.y_mut[3][1] == 0.0);
  }

  // Weighted edges: the weight scales the normalized term.
  {
    tempest::BipartiteNetwork net;
    net.pollination = Matrix{{3.0, 1.0}};
    tempest::NetworkParams p;
    p.m = 1.0;
    const auto im = tempest::build_interaction_matrices(net, p);
    TEMPEST_ASSERT(near(im.y_mut[0][1], 3.0 / 2.0)); // row sum 4
    TEMPEST_ASSERT(near(im.y_mut[1][0], 3.0 / std::sqrt(3.0)));
    TEMPEST_ASSERT(near(im.y_mut[2][0], 1.0));
    // A lone plant has nobody to compete with.
    TEMPEST_ASSERT(im.y_comp[0][0] == 0.0);
  }

  // Competition accumulates per layer; entities inactive in a layer are skipped.
  {
    const auto im = tempest::build_interaction_matrices(tempest::default_network(), tempest::NetworkParams{});
    TEMPEST_ASSERT(im.n_plants == 3);
    TEMPEST_ASSERT(im.n_animals == 6);

    // Plants are active in both layers: 2 * (-0.1 / 2).
    TEMPEST_ASSERT(near(im.y_comp[0][1], -0.1));
    // Pollinators 0 and 1 share one layer: -0.1 / 2.
    TEMPEST_ASSERT(near(im.y_comp[3][4], -0.05));
    // A pollinator and a seed disperser never compete.
    TEMPEST_ASSERT(im.y_comp[3][6] == 0.0);

    // Sign partition and empty diagonal.
    for (int i = 0; i < im.n_species(); ++i) {
      TEMPEST_ASSERT(im.y_mut[i][i] == 0.0);
      TEMPEST_ASSERT(im.y_comp[i][i] == 0.0);
      for (int j = 0; j < im.n_species(); ++j) {
        TEMPEST_ASSERT(im.y_mut[i][j] >= 0.0);
        TEMPEST_ASSERT(im.y_comp[i][j] <= 0.0);
        TEMPEST_ASSERT(im.y_mut[i][j] == 0.0 || im.y_comp[i][j] == 0.0);
      }
    }
  }

  // Layers of different shapes are zero-padded to a common size.
  {
    tempest::BipartiteNetwork net;
    net.pollination = Matrix{{1.0, 0.0}, {0.0, 1.0}};
    net.dispersal = Matrix{{0.0, 0.0, 1.0}, {0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}};
    const auto im = tempest::build_interaction_matrices(net, tempest::NetworkParams{});
    TEMPEST_ASSERT(im.n_plants == 3);
    TEMPEST_ASSERT(im.n_animals == 3);
    TEMPEST_ASSERT(im.n_species() == 6);
    TEMPEST_ASSERT(im.y_mut.size() == 6 && im.y_mut[5].size() == 6);
    TEMPEST_ASSERT(near(im.y_mut[0][5], 0.5)); // plant 0 -> disperser column 2
    TEMPEST_ASSERT(near(im.y_mut[2][3], 0.5)); // padded plant 2 -> column 0
  }

  // Ring network.
  {
    const auto im = tempest::build_ring_matrices(4, 0.3, -0.1);
    TEMPEST_ASSERT(im.n_species() == 4);
    TEMPEST_ASSERT(im.n_plants == 0 && im.n_animals == 0);
    TEMPEST_ASSERT(im.y_mut[0][1] == 0.3);
    TEMPEST_ASSERT(im.y_mut[1][0] == 0.3);
    TEMPEST_ASSERT(im.y_mut[0][3] == 0.3);
    TEMPEST_ASSERT(im.y_comp[0][2] == -0.1);
    TEMPEST_ASSERT(im.y_mut[0][2] == 0.0);
    TEMPEST_ASSERT(im.y_comp[0][0] == 0.0 && im.y_mut[0][0] == 0.0);

    const auto single = tempest::build_ring_matrices(1, 0.3, -0.1);
    TEMPEST_ASSERT(single.n_species() == 1);
    TEMPEST_ASSERT(single.y_mut[0][0] == 0.0);

    bool threw = false;
    try {
      (void)tempest::build_ring_matrices(0, 0.3, -0.1);
    } catch (const tempest::ConfigurationError&) {
      threw = true;
    }
    TEMPEST_ASSERT(threw);
  }

  // Stats and labels.
  {
    const auto st = tempest::network_stats(tempest::default_network());
    TEMPEST_ASSERT(st.n_plants == 3);
    TEMPEST_ASSERT(st.n_animals == 6);
    TEMPEST_ASSERT(st.n_total == 9);
    TEMPEST_ASSERT(st.n_pollination_links == 6);
    TEMPEST_ASSERT(st.n_dispersal_links == 6);

    TEMPEST_ASSERT(tempest::species_label(0, 3, 6) == "plant_0");
    TEMPEST_ASSERT(tempest::species_label(3, 3, 6) == "animal_0");
    TEMPEST_ASSERT(tempest::species_label(2, 0, 0) == "species_2");

    const auto labels = tempest::species_labels(tempest::build_ring_matrices(3, 0.1, 0.0));
    TEMPEST_ASSERT(labels.size() == 3);
    TEMPEST_ASSERT(labels[2] == "species_2");
  }

  return 0;
}
