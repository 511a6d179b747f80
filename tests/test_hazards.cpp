#include <cmath>
#include <iostream>
#include <vector>

#include "tempest/core/errors.h"
#include "tempest/core/hazards.h"

#define TEMPEST_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b, double eps = 1e-12) { return std::fabs(a - b) <= eps; }

double total(const std::vector<tempest::HurricaneCategory>& cats) {
  double s = 0.0;
  for (const auto& c : cats) s += c.probability;
  return s;
}

} // namespace

int test_hazards() {
  using tempest::HurricaneCategory;

  const auto defaults = tempest::default_hurricane_categories();
  TEMPEST_ASSERT(defaults.size() == 3);
  TEMPEST_ASSERT(defaults[0].label == "Category 1");
  TEMPEST_ASSERT(defaults[0].probability == 0.6 && defaults[0].damage_fraction == 0.1);
  TEMPEST_ASSERT(defaults[1].probability == 0.3 && defaults[1].damage_fraction == 0.5);
  TEMPEST_ASSERT(defaults[2].probability == 0.1 && defaults[2].damage_fraction == 0.8);

  // Waiting times.
  {
    TEMPEST_ASSERT(tempest::waiting_time_for_uniform(0.5, 0.0) == 0.0);
    TEMPEST_ASSERT(near(tempest::waiting_time_for_uniform(1.0, 1.0 - std::exp(-2.0)), 2.0, 1e-9));
    TEMPEST_ASSERT(near(tempest::waiting_time_for_uniform(0.05, 0.5), std::log(2.0) / 0.05, 1e-9));
  }

  // A zero rate schedules nothing and leaves the stream untouched.
  {
    tempest::util::SplitMixRng a(5);
    tempest::util::SplitMixRng b(5);
    TEMPEST_ASSERT(!tempest::draw_waiting_time(0.0, a).has_value());
    TEMPEST_ASSERT(!tempest::draw_waiting_time(-1.0, a).has_value());
    TEMPEST_ASSERT(a.next_u64() == b.next_u64());

    const auto w = tempest::draw_waiting_time(2.0, a);
    TEMPEST_ASSERT(w.has_value() && *w >= 0.0);
  }

  // Category selection uses an inclusive cumulative comparison.
  {
    TEMPEST_ASSERT(tempest::category_index_for_uniform(defaults, 0.0) == 0);
    TEMPEST_ASSERT(tempest::category_index_for_uniform(defaults, 0.5) == 0);
    TEMPEST_ASSERT(tempest::category_index_for_uniform(defaults, 0.6) == 0);
    TEMPEST_ASSERT(tempest::category_index_for_uniform(defaults, 0.61) == 1);
    TEMPEST_ASSERT(tempest::category_index_for_uniform(defaults, 0.85) == 1);
    TEMPEST_ASSERT(tempest::category_index_for_uniform(defaults, 0.95) == 2);

    // Shortfall falls back to the last category.
    const std::vector<HurricaneCategory> short_list{{"a", 0.2, 0.1}, {"b", 0.3, 0.2}};
    TEMPEST_ASSERT(tempest::category_index_for_uniform(short_list, 0.9) == 1);

    bool threw = false;
    try {
      (void)tempest::category_index_for_uniform({}, 0.5);
    } catch (const tempest::ConfigurationError&) {
      threw = true;
    }
    TEMPEST_ASSERT(threw);
  }

  // Seeded draws are reproducible.
  {
    tempest::util::SplitMixRng a(2024);
    tempest::util::SplitMixRng b(2024);
    for (int i = 0; i < 50; ++i) {
      TEMPEST_ASSERT(tempest::draw_category(defaults, a).label == tempest::draw_category(defaults, b).label);
      TEMPEST_ASSERT(*tempest::draw_waiting_time(0.05, a) == *tempest::draw_waiting_time(0.05, b));
    }

    // Roughly the configured frequencies over many draws.
    tempest::util::SplitMixRng rng(77);
    int counts[3] = {0, 0, 0};
    for (int i = 0; i < 20000; ++i) ++counts[tempest::category_index_for_uniform(defaults, rng.uniform())];
    TEMPEST_ASSERT(std::fabs(counts[0] / 20000.0 - 0.6) < 0.03);
    TEMPEST_ASSERT(std::fabs(counts[2] / 20000.0 - 0.1) < 0.03);
  }

  // Normalization.
  {
    const auto n = tempest::normalize_categories({{"a", 3.0, 0.1}, {"b", 1.0, 0.2}});
    TEMPEST_ASSERT(near(n[0].probability, 0.75));
    TEMPEST_ASSERT(near(n[1].probability, 0.25));
    TEMPEST_ASSERT(n[1].damage_fraction == 0.2);

    const auto z = tempest::normalize_categories({{"a", 0.0, 0.1}, {"b", 0.0, 0.2}});
    TEMPEST_ASSERT(z[0].probability == 0.5 && z[1].probability == 0.5);

    TEMPEST_ASSERT(tempest::normalize_categories({}).empty());
  }

  // Slider rebalance keeps the total at 1.
  {
    const auto r = tempest::rebalance_categories(defaults, 0, 0.2);
    TEMPEST_ASSERT(near(r[0].probability, 0.2));
    TEMPEST_ASSERT(near(r[1].probability, 0.6));
    TEMPEST_ASSERT(near(r[2].probability, 0.2));
    TEMPEST_ASSERT(near(total(r), 1.0));

    // Others at zero share the remainder equally.
    const auto e = tempest::rebalance_categories({{"a", 1.0, 0.1}, {"b", 0.0, 0.2}, {"c", 0.0, 0.3}}, 0, 0.4);
    TEMPEST_ASSERT(near(e[1].probability, 0.3));
    TEMPEST_ASSERT(near(e[2].probability, 0.3));

    // Clamped, and out-of-range index is a no-op.
    const auto c = tempest::rebalance_categories(defaults, 2, 1.5);
    TEMPEST_ASSERT(c[2].probability == 1.0);
    TEMPEST_ASSERT(c[0].probability == 0.0 && c[1].probability == 0.0);

    const auto same = tempest::rebalance_categories(defaults, 7, 0.9);
    TEMPEST_ASSERT(same[0].probability == 0.6);
  }

  return 0;
}
