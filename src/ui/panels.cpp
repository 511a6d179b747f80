#include "ui/panels.h"

#include <cstddef>
#include <cstdint>
#include <string>

#include <imgui.h>

#include "tempest/core/hazards.h"

namespace tempest::ui {
namespace {

bool slider_double(const char* label, double& v, float lo, float hi, const char* fmt = "%.3f") {
  float f = static_cast<float>(v);
  if (!ImGui::SliderFloat(label, &f, lo, hi, fmt)) return false;
  v = static_cast<double>(f);
  return true;
}

void draw_model_section(Scenario& scenario, ControlActions& actions) {
  ImGui::SeparatorText("Model");
  ModelConfig& m = scenario.model;

  // Rebuild once the drag is released; the engine is recreated with fresh draws.
  slider_double("Pollination (m)", m.mutualistic_strength, 0.0f, 2.0f);
  if (ImGui::IsItemDeactivatedAfterEdit()) actions.rebuild = true;
  slider_double("Seed dispersal (d)", m.dispersal_strength, 0.0f, 2.0f);
  if (ImGui::IsItemDeactivatedAfterEdit()) actions.rebuild = true;
  slider_double("Competition (c)", m.competition_strength, -1.0f, 0.0f);
  if (ImGui::IsItemDeactivatedAfterEdit()) actions.rebuild = true;
  slider_double("Half saturation (h)", m.half_saturation, 0.0f, 2.0f);
  if (ImGui::IsItemDeactivatedAfterEdit()) actions.rebuild = true;

  std::uint64_t seed = scenario.seed;
  if (ImGui::InputScalar("Seed", ImGuiDataType_U64, &seed) && seed != scenario.seed) {
    scenario.seed = seed;
    actions.rebuild = true;
  }
}

void draw_hurricane_section(Scenario& scenario, ControlActions& actions) {
  ImGui::SeparatorText("Hurricanes");
  SimConfig& cfg = scenario.sim;

  if (slider_double("Rate (per time unit)", cfg.hurricane_rate, 0.0f, 0.5f)) actions.hurricanes_changed = true;

  auto& cats = cfg.hurricane_categories;
  for (std::size_t i = 0; i < cats.size(); ++i) {
    ImGui::PushID(static_cast<int>(i));
    ImGui::TextUnformatted(cats[i].label.c_str());

    float p = static_cast<float>(cats[i].probability);
    if (ImGui::SliderFloat("Probability", &p, 0.0f, 1.0f, "%.2f")) {
      // Keeps the probabilities summing to 1.
      cats = rebalance_categories(cats, i, static_cast<double>(p));
      actions.hurricanes_changed = true;
    }
    if (slider_double("Damage", cats[i].damage_fraction, 0.0f, 1.0f, "%.2f")) actions.hurricanes_changed = true;
    ImGui::PopID();
  }
}

void draw_network_section(const Simulation& sim, Scenario& scenario, UIState& ui, ControlActions& actions) {
  ImGui::SeparatorText("Network");
  if (scenario.network.kind == NetworkSource::Kind::Ring) {
    ImGui::Text("Ring network, %d species", sim.n_species());
  } else {
    const NetworkStats st = network_stats(scenario.network.network);
    ImGui::Text("%d plants, %d animals", st.n_plants, st.n_animals);
    ImGui::Text("Links: %d pollination, %d dispersal", st.n_pollination_links, st.n_dispersal_links);
  }

  ImGui::InputText("Pollination CSV", ui.pollination_path, sizeof(ui.pollination_path));
  ImGui::InputText("Dispersal CSV", ui.dispersal_path, sizeof(ui.dispersal_path));
  if (ImGui::Button("Load CSV")) actions.load_csv = true;
  ImGui::SameLine();
  if (ImGui::Button("Default network")) actions.load_default_network = true;
  if (ImGui::IsItemHovered()) ImGui::SetTooltip("3 plants, 3 pollinators, 3 seed dispersers");
}

} // namespace

void draw_control_panel(const Simulation& sim, Scenario& scenario, UIState& ui, ControlActions& actions) {
  if (!ui.show_controls_window) return;

  ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(340, 640), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Controls", &ui.show_controls_window)) {
    ImGui::End();
    return;
  }

  if (ui.running) {
    if (ImGui::Button("Pause")) actions.pause = true;
  } else {
    if (ImGui::Button("Start")) actions.start = true;
  }
  ImGui::SameLine();
  if (ImGui::Button("Reset")) actions.reset = true;

  ImGui::SliderFloat("Speed", &ui.speed, 0.1f, 10.0f, "%.1fx");

  draw_model_section(scenario, actions);
  draw_hurricane_section(scenario, actions);
  draw_network_section(sim, scenario, ui, actions);

  if (!ui.last_error.empty()) {
    ImGui::Separator();
    ImGui::PushTextWrapPos(0.0f);
    ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.4f, 1.0f), "%s", ui.last_error.c_str());
    ImGui::PopTextWrapPos();
    if (ImGui::SmallButton("Dismiss")) ui.last_error.clear();
  }

  ImGui::SeparatorText("Windows");
  ImGui::Checkbox("Population chart", &ui.show_chart_window);
  ImGui::Checkbox("Network view", &ui.show_network_window);

  ImGui::End();
}

void draw_status_bar(const Simulation& sim, const UIState& ui) {
  const ImGuiViewport* vp = ImGui::GetMainViewport();
  const float height = ImGui::GetFrameHeightWithSpacing() + 6.0f;
  ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x, vp->WorkPos.y + vp->WorkSize.y - height));
  ImGui::SetNextWindowSize(ImVec2(vp->WorkSize.x, height));

  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                 ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoFocusOnAppearing;
  if (ImGui::Begin("##status", nullptr, flags)) {
    const SimSummary s = sim.summary();
    ImGui::Text("%s | t = %.2f | Hurricanes: %d | Extinct: %d / %d | Total population: %.3f",
                ui.running ? "Running" : "Paused", s.time, s.hurricane_count, s.extinct_count, s.n_species,
                s.total_population);
  }
  ImGui::End();
}

} // namespace tempest::ui
