#pragma once

#include <memory>
#include <vector>

#include <SDL.h>

#include "tempest/core/scenario.h"
#include "tempest/core/simulation.h"

#include "ui/ui_state.h"

namespace tempest::ui {

class App {
 public:
  // Throws ConfigurationError if the scenario cannot be instantiated.
  explicit App(Scenario scenario);

  // Called once per frame.
  void frame();

  // SDL keyboard shortcuts etc.
  void on_event(const SDL_Event& e);

 private:
  // Recreates the engine from scenario_. On failure the previous engine is kept
  // and the error is shown in the control panel.
  bool rebuild();
  void load_csv_network();
  void push_hurricane_settings();
  void reset_run();

  // Pulls samples recorded since the last frame into history_.
  void sync_history();

  Scenario scenario_;
  std::unique_ptr<ScenarioRun> run_;

  // Incrementally mirrored engine history for the chart.
  std::vector<OdeSample> history_;

  UIState ui_{};
};

} // namespace tempest::ui
