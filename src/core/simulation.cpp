#include "tempest/core/simulation.h"

#include <cmath>
#include <iterator>
#include <sstream>
#include <utility>

#include "tempest/core/errors.h"
#include "tempest/util/log.h"
#include "tempest/util/strings.h"

namespace tempest {
namespace {

bool all_finite(const StateVector& v) {
  for (double x : v) {
    if (!std::isfinite(x)) return false;
  }
  return true;
}

} // namespace

void validate_config(const SimConfig& cfg) {
  if (!std::isfinite(cfg.hurricane_rate) || cfg.hurricane_rate < 0.0) {
    throw ConfigurationError("hurricane_rate must be finite and >= 0 (got " + format_double(cfg.hurricane_rate) + ")");
  }
  if (!std::isfinite(cfg.time_step) || cfg.time_step <= 0.0) {
    throw ConfigurationError("time_step must be finite and > 0 (got " + format_double(cfg.time_step) + ")");
  }
  if (!(cfg.extinction_threshold_fraction >= 0.0 && cfg.extinction_threshold_fraction <= 1.0)) {
    throw ConfigurationError("extinction_threshold_fraction must be in [0, 1] (got " +
                             format_double(cfg.extinction_threshold_fraction) + ")");
  }
  if (cfg.hurricane_rate > 0.0 && cfg.hurricane_categories.empty()) {
    throw ConfigurationError("hurricane_categories must not be empty when hurricane_rate > 0");
  }
  for (const auto& c : cfg.hurricane_categories) {
    if (!std::isfinite(c.probability) || c.probability < 0.0) {
      throw ConfigurationError("hurricane category '" + c.label + "' has an invalid probability");
    }
    if (!(c.damage_fraction >= 0.0 && c.damage_fraction <= 1.0)) {
      throw ConfigurationError("hurricane category '" + c.label + "' damage_fraction must be in [0, 1]");
    }
  }
}

SimConfig merge_config(SimConfig base, const SimConfigPatch& patch) {
  if (patch.hurricane_rate) base.hurricane_rate = *patch.hurricane_rate;
  if (patch.hurricane_categories) base.hurricane_categories = *patch.hurricane_categories;
  if (patch.extinction_threshold_fraction) base.extinction_threshold_fraction = *patch.extinction_threshold_fraction;
  if (patch.time_step) base.time_step = *patch.time_step;
  return base;
}

SimState initial_state(const StateVector& initial_population) {
  SimState s;
  s.time = 0.0;
  s.populations = initial_population;
  s.history.push_back({0.0, initial_population});
  return s;
}

std::vector<double> extinction_thresholds(const StateVector& initial_population, double fraction) {
  std::vector<double> out;
  out.reserve(initial_population.size());
  for (double n0 : initial_population) out.push_back(n0 * fraction);
  return out;
}

SimState apply_shock(SimState state, double event_time, const HurricaneCategory& category,
                     const std::vector<double>& thresholds) {
  const double survival = 1.0 - category.damage_fraction;
  for (std::size_t i = 0; i < state.populations.size(); ++i) {
    const double next = state.populations[i] * survival;
    if (i < thresholds.size() && next < thresholds[i]) {
      state.populations[i] = 0.0;
      state.extinct_species.insert(static_cast<int>(i));
    } else {
      state.populations[i] = next;
    }
  }

  state.time = event_time;
  state.hurricanes.push_back({event_time, category.label, category.damage_fraction});
  state.history.push_back({event_time, state.populations});
  return state;
}

StepResult advance(SimState state, const EcologyParams& params, const SimConfig& cfg,
                   const std::vector<double>& thresholds, util::SplitMixRng& rng, double duration) {
  const double start_time = state.time;
  const double end_time = start_time + duration;

  std::optional<double> event_time;
  if (const auto wait = draw_waiting_time(cfg.hurricane_rate, rng)) {
    const double candidate = start_time + *wait;
    if (candidate <= end_time) event_time = candidate;
  }

  const double segment_end = event_time ? *event_time : end_time;
  if (segment_end > start_time) {
    const VectorField field = [&params](double t, const StateVector& y) { return type2_derivative(t, y, params); };
    std::vector<OdeSample> segment = solve_ode(field, state.populations, start_time, segment_end, cfg.time_step);

    state.populations = segment.back().y;
    state.time = segment_end;
    state.history.insert(state.history.end(), std::make_move_iterator(segment.begin() + 1),
                         std::make_move_iterator(segment.end()));
  }

  if (event_time) {
    const HurricaneCategory& category = draw_category(cfg.hurricane_categories, rng);
    state = apply_shock(std::move(state), *event_time, category, thresholds);
  }

  return {std::move(state), event_time};
}

SimSummary summarize(const SimState& state) {
  SimSummary s;
  s.time = state.time;
  s.hurricane_count = static_cast<int>(state.hurricanes.size());
  s.extinct_count = static_cast<int>(state.extinct_species.size());
  s.n_species = static_cast<int>(state.populations.size());
  for (double n : state.populations) s.total_population += n;
  return s;
}

Simulation::Simulation(EcologyParams params, StateVector initial_population, SimConfig cfg, std::uint64_t seed)
    : params_(std::move(params)), cfg_(std::move(cfg)), rng_(seed) {
  validate_params(params_);
  validate_config(cfg_);
  check_population_size(initial_population);

  initial_population_ = std::move(initial_population);
  thresholds_ = extinction_thresholds(initial_population_, cfg_.extinction_threshold_fraction);
  state_ = initial_state(initial_population_);
}

void Simulation::check_population_size(const StateVector& pop) const {
  if (static_cast<int>(pop.size()) != species_count(params_)) {
    throw ConfigurationError("Population vector has " + std::to_string(pop.size()) + " entries, expected " +
                             std::to_string(species_count(params_)));
  }
  for (double n : pop) {
    if (!std::isfinite(n) || n < 0.0) throw ConfigurationError("Initial populations must be finite and >= 0");
  }
}

std::optional<double> Simulation::step(double duration) {
  const std::size_t extinct_before = state_.extinct_species.size();

  StepResult r = advance(std::move(state_), params_, cfg_, thresholds_, rng_, duration);
  state_ = std::move(r.state);

  if (r.event_time) {
    const HurricaneEvent& ev = state_.hurricanes.back();
    std::ostringstream ss;
    ss << ev.category << " hurricane at t=" << format_double(ev.time) << " (damage "
       << format_double(ev.damage_fraction) << ")";
    log::debug(ss.str());
    if (state_.extinct_species.size() > extinct_before) {
      log::debug(std::to_string(state_.extinct_species.size() - extinct_before) + " species went extinct; " +
                 std::to_string(state_.extinct_species.size()) + " extinct in total");
    }
  }

  if (!warned_non_finite_ && !all_finite(state_.populations)) {
    warned_non_finite_ = true;
    log::warn("Non-finite population at t=" + format_double(state_.time) +
              "; check interaction strengths and half-saturation");
  }
  return r.event_time;
}

void Simulation::reset(std::optional<StateVector> initial_population) {
  if (initial_population) {
    check_population_size(*initial_population);
    initial_population_ = std::move(*initial_population);
  }
  thresholds_ = extinction_thresholds(initial_population_, cfg_.extinction_threshold_fraction);
  state_ = initial_state(initial_population_);
  warned_non_finite_ = false;
}

void Simulation::update_params(EcologyParams params) {
  validate_params(params);
  if (species_count(params) != species_count(params_)) {
    throw ConfigurationError("New parameters describe " + std::to_string(species_count(params)) +
                             " species, the running simulation has " + std::to_string(species_count(params_)));
  }
  params_ = std::move(params);
}

void Simulation::update_config(const SimConfigPatch& patch) {
  SimConfig merged = merge_config(cfg_, patch);
  validate_config(merged);
  cfg_ = std::move(merged);
}

std::vector<OdeSample> Simulation::history_since(std::size_t first) const {
  if (first >= state_.history.size()) return {};
  return std::vector<OdeSample>(state_.history.begin() + static_cast<std::ptrdiff_t>(first), state_.history.end());
}

} // namespace tempest
