#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "tempest/core/ecology.h"
#include "tempest/core/hazards.h"
#include "tempest/core/ode.h"
#include "tempest/util/rng.h"

namespace tempest {

struct SimConfig {
  // Mean number of hurricanes per unit of simulated time (Poisson rate).
  // 0 disables hurricanes entirely.
  double hurricane_rate{0.05};

  // Severity classes, in draw order. Probabilities are expected to sum to 1
  // (see normalize_categories); a small floating-point shortfall falls back to
  // the last category.
  std::vector<HurricaneCategory> hurricane_categories{default_hurricane_categories()};

  // A species whose post-hurricane population drops below
  // initial_population[i] * extinction_threshold_fraction is clamped to 0 and
  // marked extinct. Thresholds are fixed when the engine is created or reset.
  double extinction_threshold_fraction{0.01};

  // RK4 step size.
  double time_step{0.01};
};

// Partial configuration update: unset fields keep their current value.
struct SimConfigPatch {
  std::optional<double> hurricane_rate;
  std::optional<std::vector<HurricaneCategory>> hurricane_categories;
  std::optional<double> extinction_threshold_fraction;
  std::optional<double> time_step;
};

// Throws ConfigurationError describing the first invalid field.
void validate_config(const SimConfig& cfg);

SimConfig merge_config(SimConfig base, const SimConfigPatch& patch);

struct HurricaneEvent {
  double time{0.0};
  std::string category;
  double damage_fraction{0.0};
};

// Everything that changes during a run.
//
// history starts with {0, N0} and gains every integrator sample plus one
// post-hurricane sample per event. hurricanes and extinct_species only grow.
struct SimState {
  double time{0.0};
  StateVector populations;
  std::vector<OdeSample> history;
  std::vector<HurricaneEvent> hurricanes;
  std::set<int> extinct_species;
};

SimState initial_state(const StateVector& initial_population);

// thresholds[i] = initial_population[i] * fraction
std::vector<double> extinction_thresholds(const StateVector& initial_population, double fraction);

// Applies one hurricane at event_time: scales every population by
// (1 - damage_fraction), clamps species that fall below their threshold to
// exactly 0 and marks them extinct, then records the event and a history sample.
SimState apply_shock(SimState state, double event_time, const HurricaneCategory& category,
                     const std::vector<double>& thresholds);

struct StepResult {
  SimState state;
  std::optional<double> event_time; // set when a hurricane hit during the step
};

// Advances `state` by `duration` of simulated time.
//
// One candidate hurricane time is drawn from the exponential waiting-time
// distribution. If it falls inside the step, the dynamics are integrated up to
// that instant and the hurricane is applied there; the rest of the requested
// duration is not integrated. A non-positive duration integrates nothing.
StepResult advance(SimState state, const EcologyParams& params, const SimConfig& cfg,
                   const std::vector<double>& thresholds, util::SplitMixRng& rng, double duration);

// Status readout for front-ends.
struct SimSummary {
  double time{0.0};
  int hurricane_count{0};
  int extinct_count{0};
  int n_species{0};
  double total_population{0.0};
};

SimSummary summarize(const SimState& state);

// Owns one run: parameters, configuration, random stream and state.
//
// All accessors return copies; callers never alias the engine's internals.
// Not thread-safe; drive it from a single thread.
class Simulation {
 public:
  // Throws ConfigurationError if params/cfg are invalid or the initial population
  // does not match the species count.
  Simulation(EcologyParams params, StateVector initial_population, SimConfig cfg = {}, std::uint64_t seed = 0);

  // Advance by `duration`. Returns the hurricane time if one occurred.
  std::optional<double> step(double duration);

  // Back to t = 0 with an empty event log. A new initial population may be
  // supplied; thresholds are recomputed either way. The random stream continues.
  void reset(std::optional<StateVector> initial_population = std::nullopt);

  // Swap growth/interaction parameters; time and populations are kept.
  void update_params(EcologyParams params);

  // Merge new settings, effective on the next step(). An invalid patch throws
  // ConfigurationError and leaves the current configuration untouched.
  void update_config(const SimConfigPatch& patch);

  void reseed(std::uint64_t seed) { rng_.reseed(seed); }
  std::uint64_t seed() const { return rng_.seed(); }

  SimState state() const { return state_; }
  double time() const { return state_.time; }
  StateVector populations() const { return state_.populations; }
  std::vector<OdeSample> history() const { return state_.history; }
  std::vector<HurricaneEvent> hurricanes() const { return state_.hurricanes; }
  std::set<int> extinct_species() const { return state_.extinct_species; }
  SimSummary summary() const { return summarize(state_); }

  // Incremental history access for consumers that already hold a prefix.
  std::size_t history_size() const { return state_.history.size(); }
  std::vector<OdeSample> history_since(std::size_t first) const;

  SimConfig cfg() const { return cfg_; }
  EcologyParams params() const { return params_; }
  StateVector initial_population() const { return initial_population_; }
  int n_species() const { return species_count(params_); }

 private:
  void check_population_size(const StateVector& pop) const;

  EcologyParams params_;
  SimConfig cfg_;
  StateVector initial_population_;
  std::vector<double> thresholds_;
  SimState state_;
  util::SplitMixRng rng_;
  bool warned_non_finite_{false};
};

} // namespace tempest
