#include "ui/app.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>
#include <memory>
#include <string>
#include <utility>

#include <imgui.h>

#include "tempest/core/network_io.h"
#include "tempest/util/log.h"

#include "ui/network_view.h"
#include "ui/panels.h"
#include "ui/population_chart.h"

namespace tempest::ui {

App::App(Scenario scenario)
    : scenario_(std::move(scenario)), run_(std::make_unique<ScenarioRun>(instantiate(scenario_))) {
  history_ = run_->sim.history();
}

bool App::rebuild() {
  try {
    run_ = std::make_unique<ScenarioRun>(instantiate(scenario_));
    history_ = run_->sim.history();
    log::info("Simulation rebuilt with " + std::to_string(run_->sim.n_species()) + " species");
    return true;
  } catch (const std::exception& e) {
    ui_.last_error = e.what();
    log::error(std::string("Rebuild failed: ") + e.what());
    return false;
  }
}

void App::load_csv_network() {
  const std::string pollination = ui_.pollination_path;
  const std::string dispersal = ui_.dispersal_path;

  NetworkSource src;
  src.network = {};
  try {
    if (!pollination.empty()) {
      src.network.pollination = load_matrix_csv(pollination);
      src.pollination_path = pollination;
    }
    if (!dispersal.empty()) {
      src.network.dispersal = load_matrix_csv(dispersal);
      src.dispersal_path = dispersal;
    }
  } catch (const std::exception& e) {
    ui_.last_error = e.what();
    log::error(std::string("Network load failed: ") + e.what());
    return;
  }

  const NetworkSource previous = std::exchange(scenario_.network, std::move(src));
  if (!rebuild()) {
    scenario_.network = previous;
    return;
  }
  ui_.running = false;
  log::info("Loaded network from CSV");
}

void App::push_hurricane_settings() {
  SimConfigPatch patch;
  patch.hurricane_rate = scenario_.sim.hurricane_rate;
  patch.hurricane_categories = scenario_.sim.hurricane_categories;
  try {
    run_->sim.update_config(patch);
  } catch (const std::exception& e) {
    ui_.last_error = e.what();
    log::warn(std::string("Hurricane settings rejected: ") + e.what());
    // Show what the engine is actually using.
    const SimConfig current = run_->sim.cfg();
    scenario_.sim.hurricane_rate = current.hurricane_rate;
    scenario_.sim.hurricane_categories = current.hurricane_categories;
  }
}

void App::reset_run() {
  run_->sim.reset();
  history_ = run_->sim.history();
  ui_.running = false;
}

void App::sync_history() {
  const std::size_t have = history_.size();
  const std::size_t engine = run_->sim.history_size();
  if (engine < have) {
    history_ = run_->sim.history();
    return;
  }
  if (engine == have) return;
  std::vector<OdeSample> fresh = run_->sim.history_since(have);
  history_.insert(history_.end(), std::make_move_iterator(fresh.begin()), std::make_move_iterator(fresh.end()));
}

void App::frame() {
  if (ui_.running) {
    const int steps = std::max(1, static_cast<int>(std::floor(ui_.speed * 2.0f)));
    for (int i = 0; i < steps; ++i) run_->sim.step(kFrameStep);
    sync_history();
  }

  ControlActions actions;
  draw_control_panel(run_->sim, scenario_, ui_, actions);

  const SimState state = run_->sim.state();
  draw_population_chart(history_, state.hurricanes, state.extinct_species, run_->labels,
                        run_->sim.cfg().hurricane_categories, ui_);
  const BipartiteNetwork* net =
      scenario_.network.kind == NetworkSource::Kind::Bipartite ? &scenario_.network.network : nullptr;
  draw_network_view(run_->matrices, net, run_->labels, state.populations, state.extinct_species, ui_);
  draw_status_bar(run_->sim, ui_);

  if (actions.start) ui_.running = true;
  if (actions.pause) ui_.running = false;
  if (actions.hurricanes_changed) push_hurricane_settings();
  if (actions.load_csv) load_csv_network();
  if (actions.load_default_network) {
    scenario_.network = NetworkSource{};
    if (rebuild()) ui_.running = false;
  }
  if (actions.rebuild && rebuild()) ui_.running = false;
  if (actions.reset) reset_run();
}

void App::on_event(const SDL_Event& e) {
  if (e.type != SDL_KEYDOWN || ImGui::GetIO().WantTextInput) return;
  switch (e.key.keysym.sym) {
    case SDLK_SPACE:
      ui_.running = !ui_.running;
      break;
    case SDLK_r:
      reset_run();
      break;
    default:
      break;
  }
}

} // namespace tempest::ui
