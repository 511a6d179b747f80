#pragma once

#include <string>
#include <vector>

#include "tempest/core/simulation.h"

namespace tempest {

// Format population history as CSV.
//
// Header: t,<label_0>,...,<label_{n-1}>. One row per history sample, in order.
// Labels are CSV-escaped; values round-trip (see format_double). Output ends
// with a trailing newline.
std::string history_to_csv(const std::vector<OdeSample>& history, const std::vector<std::string>& labels);

// Format the hurricane log as CSV (header: time,category,damage_fraction).
std::string hurricanes_to_csv(const std::vector<HurricaneEvent>& hurricanes);

// Format a state snapshot as JSON:
//   time, populations{label: value}, extinct_species[label...],
//   hurricanes[{time, category, damage_fraction}],
//   history (only when include_history) as [{t, populations[...]}]
std::string state_to_json(const SimState& state, const std::vector<std::string>& labels,
                          bool include_history = false);

// Format a SimSummary as a JSON object. Output ends with a trailing newline.
std::string summary_to_json(const SimSummary& summary);

} // namespace tempest
