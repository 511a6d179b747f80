#include "tempest/core/hazards.h"
#include "tempest/core/network.h"
#include "tempest/core/simulation.h"

#include <cmath>
#include <cstdint>

#include <catch2/catch_test_macros.hpp>

using namespace tempest;

namespace {

// Random sparse biadjacency matrix; roughly `density` of the cells get a weight.
Matrix random_layer(util::SplitMixRng& rng, int rows, int cols, double density) {
  Matrix m(static_cast<std::size_t>(rows), std::vector<double>(static_cast<std::size_t>(cols), 0.0));
  for (auto& row : m) {
    for (double& w : row) {
      if (rng.uniform() < density) w = rng.uniform(0.1, 2.0);
    }
  }
  return m;
}

} // namespace

TEST_CASE("interaction matrices keep mutualism across guilds and competition within", "[network]") {
  for (std::uint64_t seed = 1; seed <= 40; ++seed) {
    util::SplitMixRng rng(seed);
    const int plants = 1 + static_cast<int>(rng.next_u64() % 6);
    const int animals = 1 + static_cast<int>(rng.next_u64() % 8);

    BipartiteNetwork net;
    net.pollination = random_layer(rng, plants, animals, 0.4);
    if (seed % 2 == 0) net.dispersal = random_layer(rng, plants, 1 + static_cast<int>(rng.next_u64() % 8), 0.4);

    NetworkParams p;
    p.m = rng.uniform(0.0, 1.5);
    p.d = rng.uniform(0.0, 1.5);
    p.c = -rng.uniform(0.0, 0.5);
    const InteractionMatrices im = build_interaction_matrices(net, p);

    const int n = im.n_species();
    REQUIRE(n == im.n_plants + im.n_animals);
    REQUIRE(im.n_plants == plants);
    for (int i = 0; i < n; ++i) {
      REQUIRE(im.y_mut[i][i] == 0.0);
      REQUIRE(im.y_comp[i][i] == 0.0);
      const bool i_plant = i < im.n_plants;
      for (int j = 0; j < n; ++j) {
        const bool j_plant = j < im.n_plants;
        REQUIRE(im.y_mut[i][j] >= 0.0);
        REQUIRE(im.y_comp[i][j] <= 0.0);
        if (i_plant == j_plant) REQUIRE(im.y_mut[i][j] == 0.0);
        if (i_plant != j_plant) REQUIRE(im.y_comp[i][j] == 0.0);
        // Mutualism is reciprocal: an edge shows up in both directions.
        REQUIRE((im.y_mut[i][j] > 0.0) == (im.y_mut[j][i] > 0.0));
      }
    }
  }
}

TEST_CASE("rebalanced hurricane probabilities always sum to one", "[hazards]") {
  util::SplitMixRng rng(2718);
  auto cats = default_hurricane_categories();
  for (int i = 0; i < 500; ++i) {
    const std::size_t idx = static_cast<std::size_t>(rng.next_u64() % cats.size());
    cats = rebalance_categories(cats, idx, rng.uniform(-0.2, 1.2));

    double total = 0.0;
    for (const auto& c : cats) {
      REQUIRE(c.probability >= 0.0);
      REQUIRE(c.probability <= 1.0 + 1e-12);
      total += c.probability;
    }
    REQUIRE(std::fabs(total - 1.0) < 1e-9);
  }
}

TEST_CASE("populations stay non-negative and finite under random shocks", "[simulation]") {
  for (std::uint64_t seed = 100; seed < 110; ++seed) {
    util::SplitMixRng rng(seed);
    const InteractionMatrices im = build_interaction_matrices(default_network(), NetworkParams{});
    EcologySetup setup = create_ecology_params(im, 0.5, rng);

    SimConfig cfg;
    cfg.hurricane_rate = 0.5;
    Simulation sim(setup.params, setup.initial_population, cfg, seed);
    for (int i = 0; i < 200; ++i) sim.step(0.05);

    for (double v : sim.populations()) {
      REQUIRE(std::isfinite(v));
      REQUIRE(v >= 0.0);
    }
    for (int idx : sim.extinct_species()) REQUIRE(sim.populations()[idx] == 0.0);
    REQUIRE(sim.time() <= 10.0 + 1e-9);
  }
}
