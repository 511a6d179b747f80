#include "tempest/core/hazards.h"

#include <algorithm>
#include <cmath>

#include "tempest/core/errors.h"

namespace tempest {

std::vector<HurricaneCategory> default_hurricane_categories() {
  return {
      {"Category 1", 0.6, 0.1},
      {"Category 2", 0.3, 0.5},
      {"Category 3", 0.1, 0.8},
  };
}

double waiting_time_for_uniform(double lambda, double u) { return -std::log1p(-u) / lambda; }

std::optional<double> draw_waiting_time(double lambda, util::SplitMixRng& rng) {
  if (!(lambda > 0.0)) return std::nullopt;
  return waiting_time_for_uniform(lambda, rng.uniform());
}

std::size_t category_index_for_uniform(const std::vector<HurricaneCategory>& categories, double u) {
  if (categories.empty()) throw ConfigurationError("Cannot draw a hurricane category from an empty list");

  double cumulative = 0.0;
  for (std::size_t i = 0; i < categories.size(); ++i) {
    cumulative += categories[i].probability;
    if (u <= cumulative) return i;
  }
  return categories.size() - 1;
}

const HurricaneCategory& draw_category(const std::vector<HurricaneCategory>& categories,
                                       util::SplitMixRng& rng) {
  return categories[category_index_for_uniform(categories, rng.uniform())];
}

std::vector<HurricaneCategory> normalize_categories(std::vector<HurricaneCategory> categories) {
  if (categories.empty()) return categories;

  double total = 0.0;
  for (const auto& c : categories) total += c.probability;

  const double uniform = 1.0 / static_cast<double>(categories.size());
  for (auto& c : categories) c.probability = total > 0.0 ? c.probability / total : uniform;
  return categories;
}

std::vector<HurricaneCategory> rebalance_categories(std::vector<HurricaneCategory> categories,
                                                    std::size_t index, double probability) {
  if (index >= categories.size()) return categories;

  const double p = std::clamp(probability, 0.0, 1.0);
  const double remaining = 1.0 - p;

  double others = 0.0;
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != index) others += categories[i].probability;
  }
  const std::size_t n_others = categories.size() - 1;

  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i == index) continue;
    categories[i].probability =
        others > 0.0 ? categories[i].probability / others * remaining : remaining / static_cast<double>(n_others);
  }
  categories[index].probability = p;
  return categories;
}

} // namespace tempest
