#include <algorithm>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "tempest/core/errors.h"
#include "tempest/core/network_io.h"
#include "tempest/core/scenario.h"
#include "tempest/core/simulation.h"
#include "tempest/util/file_io.h"
#include "tempest/util/history_export.h"
#include "tempest/util/log.h"
#include "tempest/util/strings.h"

namespace {

#ifndef TEMPEST_VERSION
#define TEMPEST_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

double get_double_arg(int argc, char** argv, const std::string& key, double def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stod(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_kv_arg(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return true;
  }
  return false;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "Tempest CLI v" << TEMPEST_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "tempest_cli") << " [options]\n\n";
  std::cout << "Runs the mutualistic network model with hurricane disturbances and prints a summary.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --scenario PATH       Scenario JSON (default: built-in 3x6 demo network)\n";
  std::cout << "  --pollination CSV     Plant x pollinator matrix (replaces the scenario network)\n";
  std::cout << "  --dispersal CSV       Plant x seed disperser matrix (replaces the scenario network)\n";
  std::cout << "  --ring N              Synthetic ring network of N species\n";
  std::cout << "  --m X  --d X          Pollination / seed dispersal strength\n";
  std::cout << "  --c X                 Competition strength (negative = competitive)\n";
  std::cout << "  --h X                 Half-saturation constant\n";
  std::cout << "  --rate X              Hurricane rate per unit time (0 disables hurricanes)\n";
  std::cout << "  --time-step X         RK4 step size\n";
  std::cout << "  --threshold X         Extinction threshold as a fraction of the initial population\n";
  std::cout << "  --seed N              Random seed for growth rates, initial populations and hurricanes\n";
  std::cout << "  --duration X          Simulated time to run\n";
  std::cout << "  --chunk X             Duration of each engine step\n";
  std::cout << "  --export-history PATH     Write the population history as CSV\n";
  std::cout << "  --export-hurricanes PATH  Write the hurricane log as CSV\n";
  std::cout << "  --export-state PATH       Write the final state (with history) as JSON\n";
  std::cout << "  --log-level LEVEL     debug|info|warn|error|off (default: info)\n";
  std::cout << "  --quiet               Suppress the summary\n";
  std::cout << "  -h, --help            Show this help\n";
  std::cout << "  --version             Print version and exit\n";
}

// Applies command-line overrides on top of the scenario.
void apply_overrides(int argc, char** argv, tempest::Scenario& s) {
  const std::string pollination = get_str_arg(argc, argv, "--pollination", "");
  const std::string dispersal = get_str_arg(argc, argv, "--dispersal", "");
  if (!pollination.empty() || !dispersal.empty()) {
    tempest::NetworkSource src;
    src.network = {};
    if (!pollination.empty()) {
      src.network.pollination = tempest::load_matrix_csv(pollination);
      src.pollination_path = pollination;
    }
    if (!dispersal.empty()) {
      src.network.dispersal = tempest::load_matrix_csv(dispersal);
      src.dispersal_path = dispersal;
    }
    s.network = std::move(src);
  }
  if (has_kv_arg(argc, argv, "--ring")) {
    s.network.kind = tempest::NetworkSource::Kind::Ring;
    s.network.network = {};
    s.model.n_species = get_int_arg(argc, argv, "--ring", s.model.n_species);
  }

  s.model.mutualistic_strength = get_double_arg(argc, argv, "--m", s.model.mutualistic_strength);
  s.model.dispersal_strength = get_double_arg(argc, argv, "--d", s.model.dispersal_strength);
  s.model.competition_strength = get_double_arg(argc, argv, "--c", s.model.competition_strength);
  s.model.half_saturation = get_double_arg(argc, argv, "--h", s.model.half_saturation);

  s.sim.hurricane_rate = get_double_arg(argc, argv, "--rate", s.sim.hurricane_rate);
  s.sim.time_step = get_double_arg(argc, argv, "--time-step", s.sim.time_step);
  s.sim.extinction_threshold_fraction = get_double_arg(argc, argv, "--threshold", s.sim.extinction_threshold_fraction);

  if (has_kv_arg(argc, argv, "--seed")) s.seed = std::stoull(get_str_arg(argc, argv, "--seed", "1"));
  s.run.duration = get_double_arg(argc, argv, "--duration", s.run.duration);
  s.run.chunk = get_double_arg(argc, argv, "--chunk", s.run.chunk);
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << TEMPEST_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const bool quiet = has_flag(argc, argv, "--quiet");
    tempest::log::set_level(tempest::log::Level::Info);
    if (has_kv_arg(argc, argv, "--log-level")) {
      const std::string raw = get_str_arg(argc, argv, "--log-level", "info");
      tempest::log::Level lvl = tempest::log::Level::Info;
      if (!tempest::log::parse_level(raw, lvl)) {
        std::cerr << "Unknown --log-level: " << raw << "\n\n";
        print_usage(argv[0]);
        return 1;
      }
      tempest::log::set_level(lvl);
    }

    const std::string scenario_path = get_str_arg(argc, argv, "--scenario", "");
    tempest::Scenario scenario =
        scenario_path.empty() ? tempest::Scenario{} : tempest::load_scenario_file(scenario_path);
    apply_overrides(argc, argv, scenario);

    if (!(scenario.run.chunk > 0.0)) throw tempest::ConfigurationError("--chunk must be > 0");
    if (!(scenario.run.duration >= 0.0)) throw tempest::ConfigurationError("--duration must be >= 0");

    tempest::ScenarioRun run = tempest::instantiate(scenario);
    tempest::Simulation& sim = run.sim;
    tempest::log::info("Running " + std::to_string(sim.n_species()) + " species for t=" +
                       tempest::format_double(scenario.run.duration) + " (seed " + std::to_string(scenario.seed) +
                       ")");

    std::size_t extinct_seen = 0;
    while (sim.time() < scenario.run.duration) {
      const double remaining = scenario.run.duration - sim.time();
      if (!sim.step(std::min(scenario.run.chunk, remaining))) continue;

      const tempest::HurricaneEvent ev = sim.hurricanes().back();
      std::ostringstream ss;
      ss << "t=" << tempest::format_double(ev.time) << ": " << ev.category << " hurricane";
      const auto extinct = sim.extinct_species();
      if (extinct.size() > extinct_seen) {
        ss << ", " << (extinct.size() - extinct_seen) << " species lost";
        extinct_seen = extinct.size();
      }
      tempest::log::info(ss.str());
    }

    const tempest::SimState state = sim.state();
    if (!quiet) {
      const tempest::SimSummary sum = tempest::summarize(state);
      std::cout << "Time: " << tempest::format_double(sum.time) << "\n";
      std::cout << "Species: " << sum.n_species << ", Hurricanes: " << sum.hurricane_count
                << ", Extinct: " << sum.extinct_count << "\n";
      std::cout << "Total population: " << tempest::format_double(sum.total_population) << "\n\n";
      for (std::size_t i = 0; i < state.populations.size(); ++i) {
        std::cout << "  " << run.labels[i] << ": " << tempest::format_double(state.populations[i])
                  << (state.extinct_species.count(static_cast<int>(i)) ? "  (extinct)" : "") << "\n";
      }
    }

    const std::string history_path = get_str_arg(argc, argv, "--export-history", "");
    if (!history_path.empty()) {
      tempest::write_text_file(history_path, tempest::history_to_csv(state.history, run.labels));
      if (!quiet) std::cout << "\nWrote history CSV to " << history_path << "\n";
    }
    const std::string hurricanes_path = get_str_arg(argc, argv, "--export-hurricanes", "");
    if (!hurricanes_path.empty()) {
      tempest::write_text_file(hurricanes_path, tempest::hurricanes_to_csv(state.hurricanes));
      if (!quiet) std::cout << "Wrote hurricane log to " << hurricanes_path << "\n";
    }
    const std::string state_path = get_str_arg(argc, argv, "--export-state", "");
    if (!state_path.empty()) {
      tempest::write_text_file(state_path, tempest::state_to_json(state, run.labels, true));
      if (!quiet) std::cout << "Wrote state JSON to " << state_path << "\n";
    }

    return 0;
  } catch (const std::exception& e) {
    tempest::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
