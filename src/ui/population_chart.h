#pragma once

#include <set>
#include <string>
#include <vector>

#include "tempest/core/hazards.h"
#include "tempest/core/simulation.h"

#include "ui/ui_state.h"

namespace tempest::ui {

// Population trajectories over time, one line per species.
//
// Hurricanes are drawn as vertical markers colored by category (matched by
// label against `categories`); extinct species are drawn dimmed.
void draw_population_chart(const std::vector<OdeSample>& history, const std::vector<HurricaneEvent>& hurricanes,
                           const std::set<int>& extinct, const std::vector<std::string>& labels,
                           const std::vector<HurricaneCategory>& categories, UIState& ui);

} // namespace tempest::ui
