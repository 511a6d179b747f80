#include "ui/network_view.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include <imgui.h>

namespace tempest::ui {
namespace {

const ImU32 kPollinationCol = IM_COL32(90, 200, 110, 170);
const ImU32 kDispersalCol = IM_COL32(80, 150, 240, 170);
const ImU32 kRingCol = IM_COL32(200, 200, 120, 170);

float node_radius(const StateVector& pop, std::size_t i, double pop_max) {
  const double v = (i < pop.size() && std::isfinite(pop[i])) ? pop[i] : 0.0;
  return 4.0f + 10.0f * static_cast<float>(std::sqrt(std::clamp(v / pop_max, 0.0, 1.0)));
}

void draw_layer_edges(ImDrawList* dl, const Matrix& w, const std::vector<ImVec2>& pos, int np, ImU32 col,
                      float offset, bool show_weights) {
  double wmax = 0.0;
  for (const auto& row : w) {
    for (double v : row) wmax = std::max(wmax, v);
  }
  if (wmax <= 0.0) return;

  for (std::size_t i = 0; i < w.size(); ++i) {
    for (std::size_t j = 0; j < w[i].size(); ++j) {
      if (w[i][j] <= 0.0) continue;
      const ImVec2 a = pos[i];
      const ImVec2 b = pos[static_cast<std::size_t>(np) + j];
      const float thick = show_weights ? 0.5f + 3.0f * static_cast<float>(w[i][j] / wmax) : 1.5f;
      // Small vertical offset keeps overlapping layers distinguishable.
      dl->AddLine(ImVec2(a.x, a.y + offset), ImVec2(b.x, b.y + offset), col, thick);
    }
  }
}

} // namespace

void draw_network_view(const InteractionMatrices& matrices, const BipartiteNetwork* network,
                       const std::vector<std::string>& labels, const StateVector& populations,
                       const std::set<int>& extinct, UIState& ui) {
  if (!ui.show_network_window) return;

  ImGui::SetNextWindowPos(ImVec2(360, 440), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(520, 300), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Network", &ui.show_network_window)) {
    ImGui::End();
    return;
  }

  ImGui::Checkbox("Edge width by weight", &ui.network_show_weights);
  if (network) {
    ImGui::SameLine();
    ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(kPollinationCol), "pollination");
    ImGui::SameLine();
    ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(kDispersalCol), "seed dispersal");
  }

  const int n = matrices.n_species();
  const ImVec2 avail = ImGui::GetContentRegionAvail();
  const ImVec2 size(std::max(120.0f, avail.x), std::max(120.0f, avail.y));
  const ImVec2 p0 = ImGui::GetCursorScreenPos();
  const ImVec2 p1(p0.x + size.x, p0.y + size.y);
  ImGui::InvisibleButton("##network_canvas", size);

  ImDrawList* dl = ImGui::GetWindowDrawList();
  dl->AddRectFilled(p0, p1, ImGui::GetColorU32(ImGuiCol_FrameBg), 3.0f);
  if (n == 0) {
    ImGui::End();
    return;
  }

  std::vector<ImVec2> pos(static_cast<std::size_t>(n));
  const int np = matrices.n_plants;
  const int na = matrices.n_animals;
  const bool bipartite = network && np + na == n;
  if (bipartite) {
    const float xl = p0.x + size.x * 0.25f;
    const float xr = p0.x + size.x * 0.75f;
    for (int i = 0; i < np; ++i) pos[i] = ImVec2(xl, p0.y + size.y * (i + 1.0f) / (np + 1.0f));
    for (int j = 0; j < na; ++j) pos[np + j] = ImVec2(xr, p0.y + size.y * (j + 1.0f) / (na + 1.0f));

    if (network->pollination) draw_layer_edges(dl, *network->pollination, pos, np, kPollinationCol, -1.5f, ui.network_show_weights);
    if (network->dispersal) draw_layer_edges(dl, *network->dispersal, pos, np, kDispersalCol, 1.5f, ui.network_show_weights);
  } else {
    const ImVec2 c(p0.x + size.x * 0.5f, p0.y + size.y * 0.5f);
    const float r = 0.38f * std::min(size.x, size.y);
    for (int i = 0; i < n; ++i) {
      const float a = 6.2831853f * static_cast<float>(i) / static_cast<float>(n) - 1.5707963f;
      pos[i] = ImVec2(c.x + r * std::cos(a), c.y + r * std::sin(a));
    }
    for (int i = 0; i < n; ++i) {
      for (int j = i + 1; j < n; ++j) {
        if (matrices.y_mut[i][j] > 0.0 || matrices.y_mut[j][i] > 0.0) dl->AddLine(pos[i], pos[j], kRingCol, 1.5f);
      }
    }
  }

  double pop_max = 1e-9;
  for (double v : populations) {
    if (std::isfinite(v)) pop_max = std::max(pop_max, v);
  }

  const ImVec2 mouse = ImGui::GetIO().MousePos;
  int hovered = -1;
  for (int i = 0; i < n; ++i) {
    const bool dead = extinct.count(i) > 0;
    const float rad = node_radius(populations, static_cast<std::size_t>(i), pop_max);
    const bool plant = bipartite && i < np;
    const ImU32 fill = dead ? IM_COL32(90, 90, 90, 200) : (plant ? IM_COL32(120, 210, 120, 255) : IM_COL32(230, 170, 80, 255));
    dl->AddCircleFilled(pos[i], rad, fill);
    dl->AddCircle(pos[i], rad, ImGui::GetColorU32(ImGuiCol_Border));

    const float dx = mouse.x - pos[i].x;
    const float dy = mouse.y - pos[i].y;
    if (dx * dx + dy * dy <= rad * rad) hovered = i;
  }

  if (hovered >= 0 && ImGui::IsItemHovered()) {
    const auto hi = static_cast<std::size_t>(hovered);
    ImGui::BeginTooltip();
    ImGui::TextUnformatted(hi < labels.size() ? labels[hi].c_str() : "?");
    if (hi < populations.size()) ImGui::Text("N = %.4f", populations[hi]);
    if (extinct.count(hovered)) ImGui::TextDisabled("extinct");
    ImGui::EndTooltip();
  }

  ImGui::End();
}

} // namespace tempest::ui
