#pragma once

#include <set>
#include <string>
#include <vector>

#include "tempest/core/network.h"
#include "tempest/core/ode.h"

#include "ui/ui_state.h"

namespace tempest::ui {

// Plants on the left, animals on the right, pollination links in green and seed
// dispersal links in blue. `network` may be null (ring networks), in which case
// the species are laid out on a circle and mutualistic pairs are drawn from
// `matrices`. Node size follows the current population.
void draw_network_view(const InteractionMatrices& matrices, const BipartiteNetwork* network,
                       const std::vector<std::string>& labels, const StateVector& populations,
                       const std::set<int>& extinct, UIState& ui);

} // namespace tempest::ui
