#include "tempest/util/history_export.h"

#include <algorithm>
#include <cstddef>
#include <string>

#include "tempest/core/network.h"
#include "tempest/util/json.h"
#include "tempest/util/strings.h"

namespace tempest {
namespace {

// Falls back to a generic label when the caller supplied too few.
std::string label_at(const std::vector<std::string>& labels, std::size_t i) {
  if (i < labels.size()) return labels[i];
  return species_label(static_cast<int>(i), 0, 0);
}

json::Array numbers_to_json(const std::vector<double>& v) {
  json::Array out;
  out.reserve(v.size());
  for (double x : v) out.emplace_back(x);
  return out;
}

} // namespace

std::string history_to_csv(const std::vector<OdeSample>& history, const std::vector<std::string>& labels) {
  std::size_t n = labels.size();
  for (const auto& s : history) n = std::max(n, s.y.size());

  std::string csv = "t";
  for (std::size_t i = 0; i < n; ++i) {
    csv += ',';
    csv += csv_escape(label_at(labels, i));
  }
  csv += '\n';

  csv.reserve(csv.size() + history.size() * (n + 1) * 12);
  for (const auto& s : history) {
    csv += format_double(s.t);
    for (std::size_t i = 0; i < n; ++i) {
      csv += ',';
      if (i < s.y.size()) csv += format_double(s.y[i]);
    }
    csv += '\n';
  }
  return csv;
}

std::string hurricanes_to_csv(const std::vector<HurricaneEvent>& hurricanes) {
  std::string csv = "time,category,damage_fraction\n";
  for (const auto& h : hurricanes) {
    csv += format_double(h.time);
    csv += ',';
    csv += csv_escape(h.category);
    csv += ',';
    csv += format_double(h.damage_fraction);
    csv += '\n';
  }
  return csv;
}

std::string state_to_json(const SimState& state, const std::vector<std::string>& labels, bool include_history) {
  json::Object root;
  root["time"] = state.time;

  json::Object pops;
  for (std::size_t i = 0; i < state.populations.size(); ++i) pops[label_at(labels, i)] = state.populations[i];
  root["populations"] = std::move(pops);

  json::Array extinct;
  for (int idx : state.extinct_species) extinct.emplace_back(label_at(labels, static_cast<std::size_t>(idx)));
  root["extinct_species"] = std::move(extinct);

  json::Array events;
  for (const auto& h : state.hurricanes) {
    json::Object e;
    e["time"] = h.time;
    e["category"] = h.category;
    e["damage_fraction"] = h.damage_fraction;
    events.emplace_back(std::move(e));
  }
  root["hurricanes"] = std::move(events);

  if (include_history) {
    json::Array hist;
    hist.reserve(state.history.size());
    for (const auto& s : state.history) {
      json::Object row;
      row["t"] = s.t;
      row["populations"] = numbers_to_json(s.y);
      hist.emplace_back(std::move(row));
    }
    root["history"] = std::move(hist);
  }

  return json::stringify(root) + "\n";
}

std::string summary_to_json(const SimSummary& summary) {
  json::Object o;
  o["time"] = summary.time;
  o["hurricane_count"] = static_cast<double>(summary.hurricane_count);
  o["extinct_count"] = static_cast<double>(summary.extinct_count);
  o["n_species"] = static_cast<double>(summary.n_species);
  o["total_population"] = summary.total_population;
  return json::stringify(o) + "\n";
}

} // namespace tempest
