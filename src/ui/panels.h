#pragma once

#include "tempest/core/scenario.h"
#include "tempest/core/simulation.h"

#include "ui/ui_state.h"

namespace tempest::ui {

// What the control panel asked for this frame. The App applies these after
// drawing so the engine is never swapped out mid-panel.
struct ControlActions {
  bool start{false};
  bool pause{false};
  bool reset{false};

  // Model or network changed: rebuild the engine from the scenario.
  bool rebuild{false};

  bool load_csv{false};
  bool load_default_network{false};

  // Hurricane settings changed: push them through Simulation::update_config.
  bool hurricanes_changed{false};
};

// Sliders edit `scenario` in place and flag what changed in `actions`.
void draw_control_panel(const Simulation& sim, Scenario& scenario, UIState& ui, ControlActions& actions);

void draw_status_bar(const Simulation& sim, const UIState& ui);

} // namespace tempest::ui
