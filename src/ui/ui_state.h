#pragma once

#include <string>

namespace tempest::ui {

// Front-end state that is not part of the model (not saved in scenarios).
struct UIState {
  bool running{false};

  // Each frame advances the engine max(1, floor(speed * 2)) times by kFrameStep.
  float speed{1.0f};

  bool show_controls_window{true};
  bool show_chart_window{true};
  bool show_network_window{true};

  // Population chart.
  bool chart_log_scale{false};
  bool chart_show_markers{true};
  bool chart_show_legend{true};

  // Network view.
  bool network_show_weights{false};

  // CSV network loading (simple text inputs).
  char pollination_path[256] = "data/networks/default_pollination.csv";
  char dispersal_path[256] = "data/networks/default_dispersal.csv";

  // Last load / configuration error, shown in the control panel until dismissed.
  std::string last_error;
};

// Engine step used by the interactive front-end.
inline constexpr double kFrameStep = 0.01;

} // namespace tempest::ui
