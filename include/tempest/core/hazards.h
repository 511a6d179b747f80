#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "tempest/util/rng.h"

namespace tempest {

// A hurricane severity class. A hit multiplies every population by
// (1 - damage_fraction).
struct HurricaneCategory {
  std::string label;
  double probability{0.0};
  double damage_fraction{0.0};
};

// Category 1 (p=0.6, 10% damage), Category 2 (0.3, 50%), Category 3 (0.1, 80%).
std::vector<HurricaneCategory> default_hurricane_categories();

// Exponential waiting time for a given uniform draw: -ln(1 - u) / lambda.
double waiting_time_for_uniform(double lambda, double u);

// Time until the next event of a Poisson process with rate lambda.
// Returns nullopt without consuming a draw when lambda <= 0 (no events scheduled).
std::optional<double> draw_waiting_time(double lambda, util::SplitMixRng& rng);

// Index of the first category whose cumulative probability (in list order) is
// >= u. If floating-point shortfall leaves u above the total, the last category
// is returned. Throws ConfigurationError on an empty list.
std::size_t category_index_for_uniform(const std::vector<HurricaneCategory>& categories, double u);

// Draws a category using one uniform draw from rng.
const HurricaneCategory& draw_category(const std::vector<HurricaneCategory>& categories,
                                       util::SplitMixRng& rng);

// Rescales probabilities to sum to 1. When the total is <= 0 every category
// gets 1/n.
std::vector<HurricaneCategory> normalize_categories(std::vector<HurricaneCategory> categories);

// Sets categories[index].probability (clamped to [0,1]) and spreads the
// remainder over the other categories in proportion to their previous
// probabilities, or equally if those were all zero. Out-of-range index is a no-op.
std::vector<HurricaneCategory> rebalance_categories(std::vector<HurricaneCategory> categories,
                                                    std::size_t index, double probability);

} // namespace tempest
