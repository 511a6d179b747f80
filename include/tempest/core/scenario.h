#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tempest/core/ecology.h"
#include "tempest/core/network.h"
#include "tempest/core/simulation.h"

namespace tempest {

// Where the interaction network comes from.
struct NetworkSource {
  enum class Kind { Bipartite, Ring };

  Kind kind{Kind::Bipartite};
  BipartiteNetwork network{default_network()};

  // Set when a layer was loaded from a CSV file; written back by scenario_to_json
  // instead of the inline matrix.
  std::string pollination_path;
  std::string dispersal_path;
};

struct RunSettings {
  double duration{100.0}; // total simulated time for headless runs
  double chunk{0.01};     // duration passed to each Simulation::step call
};

// Everything needed to start a run, as stored in a scenario JSON file.
struct Scenario {
  std::uint64_t seed{1};
  NetworkSource network;
  ModelConfig model;
  SimConfig sim;
  RunSettings run;
};

// Parses scenario JSON. Relative CSV paths are resolved against base_dir.
// Missing keys keep their defaults; hurricane category probabilities are
// normalized. Throws FormatError for malformed JSON, wrong value types, or a
// malformed CSV layer.
Scenario parse_scenario_json(const std::string& text, const std::string& base_dir = "");

Scenario load_scenario_file(const std::string& path);

std::string scenario_to_json(const Scenario& scenario);

NetworkParams network_params(const ModelConfig& model);

// Builds the interaction matrices a scenario describes. Throws ConfigurationError.
InteractionMatrices build_matrices(const Scenario& scenario);

struct ScenarioRun {
  InteractionMatrices matrices;
  std::vector<std::string> labels;
  Simulation sim;
};

// Builds matrices, draws growth rates and initial populations from the scenario
// seed, and constructs the engine (its hurricane stream also uses the seed).
ScenarioRun instantiate(const Scenario& scenario);

} // namespace tempest
