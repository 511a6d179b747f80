#include "tempest/core/scenario.h"

#include <cmath>
#include <optional>
#include <stdexcept>
#include <utility>

#include "tempest/core/errors.h"
#include "tempest/core/network_io.h"
#include "tempest/util/file_io.h"
#include "tempest/util/json.h"

namespace tempest {
namespace {

double number_field(const json::Value& obj, const char* key, double def) {
  const json::Value* v = obj.find(key);
  if (!v) return def;
  if (!v->is_number()) throw FormatError(std::string("Scenario key '") + key + "' must be a number");
  return *v->as_number();
}

const json::Value* object_field(const json::Value& obj, const char* key) {
  const json::Value* v = obj.find(key);
  if (v && !v->is_object()) throw FormatError(std::string("Scenario key '") + key + "' must be an object");
  return v;
}

Matrix matrix_from_json(const json::Value& v, const char* layer) {
  const auto* rows = v.as_array();
  if (!rows) throw FormatError(std::string("Scenario layer '") + layer + "' must be a path or an array of rows");
  Matrix m;
  for (const auto& row_v : *rows) {
    const auto* row = row_v.as_array();
    if (!row) throw FormatError(std::string("Scenario layer '") + layer + "' rows must be arrays");
    std::vector<double> r;
    for (const auto& cell : *row) {
      if (!cell.is_number()) throw FormatError(std::string("Scenario layer '") + layer + "' has a non-numeric cell");
      r.push_back(*cell.as_number());
    }
    m.push_back(std::move(r));
  }
  return m;
}

// A layer is either an inline matrix or a CSV path.
std::optional<Matrix> read_layer(const json::Value& net, const char* key, const std::string& base_dir,
                                 std::string& path_out) {
  const json::Value* v = net.find(key);
  if (!v || v->is_null()) return std::nullopt;
  if (const auto* path = v->as_string()) {
    path_out = *path;
    return load_matrix_csv(resolve_relative(base_dir, *path));
  }
  return matrix_from_json(*v, key);
}

NetworkSource read_network(const json::Value& net, const std::string& base_dir, ModelConfig& model) {
  NetworkSource src;
  if (const json::Value* ring = object_field(net, "ring")) {
    src.kind = NetworkSource::Kind::Ring;
    src.network = {};
    model.n_species = static_cast<int>(number_field(*ring, "species", model.n_species));
    return src;
  }
  src.network.pollination = read_layer(net, "pollination", base_dir, src.pollination_path);
  src.network.dispersal = read_layer(net, "dispersal", base_dir, src.dispersal_path);
  return src;
}

std::vector<HurricaneCategory> read_categories(const json::Value& v) {
  const auto* arr = v.as_array();
  if (!arr) throw FormatError("Scenario key 'hurricane_categories' must be an array");
  std::vector<HurricaneCategory> out;
  for (const auto& item : *arr) {
    if (!item.is_object()) throw FormatError("Each hurricane category must be an object");
    HurricaneCategory c;
    c.label = item.find("label") ? item.at("label").string_value() : "Category " + std::to_string(out.size() + 1);
    c.probability = number_field(item, "probability", 0.0);
    c.damage_fraction = number_field(item, "damage_fraction", 0.0);
    out.push_back(std::move(c));
  }
  return normalize_categories(std::move(out));
}

json::Value matrix_to_json(const Matrix& m) {
  json::Array rows;
  for (const auto& r : m) {
    json::Array row;
    for (double w : r) row.emplace_back(w);
    rows.emplace_back(std::move(row));
  }
  return rows;
}

json::Value layer_to_json(const std::optional<Matrix>& layer, const std::string& path) {
  if (!path.empty()) return std::string(path);
  if (!layer) return nullptr;
  return matrix_to_json(*layer);
}

} // namespace

Scenario parse_scenario_json(const std::string& text, const std::string& base_dir) {
  json::Value root;
  try {
    root = json::parse(text);
  } catch (const std::runtime_error& e) {
    throw FormatError(e.what());
  }
  if (!root.is_object()) throw FormatError("Scenario must be a JSON object");

  Scenario s;
  if (const json::Value* seed = root.find("seed")) {
    if (!seed->is_number() || *seed->as_number() < 0.0) throw FormatError("Scenario key 'seed' must be a non-negative number");
    s.seed = static_cast<std::uint64_t>(*seed->as_number());
  }

  if (const json::Value* p = object_field(root, "params")) {
    s.model.mutualistic_strength = number_field(*p, "m", s.model.mutualistic_strength);
    s.model.dispersal_strength = number_field(*p, "d", s.model.dispersal_strength);
    s.model.competition_strength = number_field(*p, "c", s.model.competition_strength);
    s.model.half_saturation = number_field(*p, "h", s.model.half_saturation);
  }

  if (const json::Value* net = root.find("network")) {
    if (net->is_string() && net->string_value() == "default") {
      s.network = NetworkSource{};
    } else if (net->is_object()) {
      s.network = read_network(*net, base_dir, s.model);
    } else {
      throw FormatError("Scenario key 'network' must be an object or \"default\"");
    }
  }

  if (const json::Value* sim = object_field(root, "simulation")) {
    s.sim.hurricane_rate = number_field(*sim, "hurricane_rate", s.sim.hurricane_rate);
    s.sim.extinction_threshold_fraction =
        number_field(*sim, "extinction_threshold_fraction", s.sim.extinction_threshold_fraction);
    s.sim.time_step = number_field(*sim, "time_step", s.sim.time_step);
    if (const json::Value* cats = sim->find("hurricane_categories")) s.sim.hurricane_categories = read_categories(*cats);
  }

  if (const json::Value* run = object_field(root, "run")) {
    s.run.duration = number_field(*run, "duration", s.run.duration);
    s.run.chunk = number_field(*run, "chunk", s.run.chunk);
  }
  return s;
}

Scenario load_scenario_file(const std::string& path) {
  try {
    return parse_scenario_json(read_text_file(path), parent_dir(path));
  } catch (const FormatError& e) {
    throw FormatError(path + ": " + e.what());
  }
}

std::string scenario_to_json(const Scenario& s) {
  json::Object net;
  if (s.network.kind == NetworkSource::Kind::Ring) {
    json::Object ring;
    ring["species"] = static_cast<double>(s.model.n_species);
    net["ring"] = std::move(ring);
  } else {
    net["pollination"] = layer_to_json(s.network.network.pollination, s.network.pollination_path);
    net["dispersal"] = layer_to_json(s.network.network.dispersal, s.network.dispersal_path);
  }

  json::Object params;
  params["m"] = s.model.mutualistic_strength;
  params["d"] = s.model.dispersal_strength;
  params["c"] = s.model.competition_strength;
  params["h"] = s.model.half_saturation;

  json::Array cats;
  for (const auto& c : s.sim.hurricane_categories) {
    json::Object o;
    o["label"] = c.label;
    o["probability"] = c.probability;
    o["damage_fraction"] = c.damage_fraction;
    cats.emplace_back(std::move(o));
  }

  json::Object sim;
  sim["hurricane_rate"] = s.sim.hurricane_rate;
  sim["extinction_threshold_fraction"] = s.sim.extinction_threshold_fraction;
  sim["time_step"] = s.sim.time_step;
  sim["hurricane_categories"] = std::move(cats);

  json::Object run;
  run["duration"] = s.run.duration;
  run["chunk"] = s.run.chunk;

  json::Object root;
  root["seed"] = static_cast<double>(s.seed);
  root["network"] = std::move(net);
  root["params"] = std::move(params);
  root["simulation"] = std::move(sim);
  root["run"] = std::move(run);
  return json::stringify(root) + "\n";
}

NetworkParams network_params(const ModelConfig& model) {
  NetworkParams p;
  p.m = model.mutualistic_strength;
  p.d = model.dispersal_strength;
  p.c = model.competition_strength;
  return p;
}

InteractionMatrices build_matrices(const Scenario& scenario) {
  if (scenario.network.kind == NetworkSource::Kind::Ring) {
    return build_ring_matrices(scenario.model.n_species, scenario.model.mutualistic_strength,
                               scenario.model.competition_strength);
  }
  return build_interaction_matrices(scenario.network.network, network_params(scenario.model));
}

ScenarioRun instantiate(const Scenario& scenario) {
  InteractionMatrices matrices = build_matrices(scenario);
  util::SplitMixRng rng(scenario.seed);
  EcologySetup setup = create_ecology_params(matrices, scenario.model.half_saturation, rng);
  std::vector<std::string> labels = species_labels(matrices);

  // Hurricanes draw from a stream decorrelated from the parameter draws.
  Simulation sim(std::move(setup.params), std::move(setup.initial_population), scenario.sim,
                 util::splitmix64(scenario.seed ^ 0x68757272696361ULL));
  return ScenarioRun{std::move(matrices), std::move(labels), std::move(sim)};
}

} // namespace tempest
