#include "ui/population_chart.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include <imgui.h>

namespace tempest::ui {
namespace {

constexpr double kLogFloor = 1e-4;

ImU32 species_color(int i, bool dimmed) {
  // Golden-ratio hue walk gives well separated colors for any species count.
  const float hue = std::fmod(0.07f + 0.618034f * static_cast<float>(i), 1.0f);
  float r = 0.0f, g = 0.0f, b = 0.0f;
  ImGui::ColorConvertHSVtoRGB(hue, dimmed ? 0.15f : 0.65f, dimmed ? 0.45f : 0.95f, r, g, b);
  return ImGui::ColorConvertFloat4ToU32(ImVec4(r, g, b, dimmed ? 0.45f : 1.0f));
}

ImU32 category_color(const std::string& label, const std::vector<HurricaneCategory>& categories) {
  static const ImU32 palette[] = {
      IM_COL32(250, 210, 60, 200), // mild
      IM_COL32(250, 140, 40, 210),
      IM_COL32(230, 50, 50, 230), // severe
  };
  constexpr std::size_t palette_n = sizeof(palette) / sizeof(palette[0]);
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (categories[i].label == label) return palette[std::min(i, palette_n - 1)];
  }
  return IM_COL32(160, 160, 160, 200);
}

double plot_value(double v, bool log_scale) {
  if (!std::isfinite(v)) return 0.0;
  return log_scale ? std::log10(std::max(v, kLogFloor)) : v;
}

} // namespace

void draw_population_chart(const std::vector<OdeSample>& history, const std::vector<HurricaneEvent>& hurricanes,
                           const std::set<int>& extinct, const std::vector<std::string>& labels,
                           const std::vector<HurricaneCategory>& categories, UIState& ui) {
  if (!ui.show_chart_window) return;

  ImGui::SetNextWindowPos(ImVec2(360, 10), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(900, 420), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Populations", &ui.show_chart_window)) {
    ImGui::End();
    return;
  }

  ImGui::Checkbox("Log scale", &ui.chart_log_scale);
  ImGui::SameLine();
  ImGui::Checkbox("Hurricane markers", &ui.chart_show_markers);
  ImGui::SameLine();
  ImGui::Checkbox("Legend", &ui.chart_show_legend);

  if (history.empty()) {
    ImGui::TextDisabled("(no data)");
    ImGui::End();
    return;
  }

  const std::size_t n_species = history.front().y.size();
  const double t0 = history.front().t;
  const double t1 = std::max(history.back().t, t0 + 1e-9);

  double ymin = ui.chart_log_scale ? std::log10(kLogFloor) : 0.0;
  double ymax = ymin + 1e-6;
  for (const auto& s : history) {
    for (double v : s.y) ymax = std::max(ymax, plot_value(v, ui.chart_log_scale));
  }
  ymax += (ymax - ymin) * 0.05;

  const float legend_w = ui.chart_show_legend ? 150.0f : 0.0f;
  const ImVec2 avail = ImGui::GetContentRegionAvail();
  const ImVec2 plot_size(std::max(100.0f, avail.x - legend_w), std::max(80.0f, avail.y));
  const ImVec2 p0 = ImGui::GetCursorScreenPos();
  const ImVec2 p1(p0.x + plot_size.x, p0.y + plot_size.y);
  ImGui::InvisibleButton("##population_plot", plot_size);
  const bool hovered = ImGui::IsItemHovered();

  ImDrawList* dl = ImGui::GetWindowDrawList();
  dl->AddRectFilled(p0, p1, ImGui::GetColorU32(ImGuiCol_FrameBg), 3.0f);
  dl->AddRect(p0, p1, ImGui::GetColorU32(ImGuiCol_Border), 3.0f);

  const ImU32 grid = ImGui::GetColorU32(ImGuiCol_BorderShadow);
  for (int gi = 1; gi < 4; ++gi) {
    const float y = p0.y + static_cast<float>(gi) / 4.0f * plot_size.y;
    dl->AddLine(ImVec2(p0.x, y), ImVec2(p1.x, y), grid, 1.0f);
  }

  auto to_screen = [&](double t, double v) {
    const double fx = (t - t0) / (t1 - t0);
    const double fy = (v - ymin) / (ymax - ymin);
    return ImVec2(static_cast<float>(p0.x + fx * plot_size.x),
                  static_cast<float>(p1.y - std::clamp(fy, 0.0, 1.0) * plot_size.y));
  };

  dl->PushClipRect(p0, p1, true);

  if (ui.chart_show_markers) {
    for (const auto& h : hurricanes) {
      const ImVec2 a = to_screen(h.time, ymin);
      dl->AddLine(ImVec2(a.x, p0.y), ImVec2(a.x, p1.y), category_color(h.category, categories), 1.5f);
    }
  }

  // At most ~2 samples per pixel column.
  const std::size_t max_points = static_cast<std::size_t>(plot_size.x) * 2;
  const std::size_t stride = std::max<std::size_t>(1, history.size() / std::max<std::size_t>(1, max_points));

  std::vector<ImVec2> pts;
  pts.reserve(history.size() / stride + 2);
  for (std::size_t sp = 0; sp < n_species; ++sp) {
    pts.clear();
    for (std::size_t k = 0; k < history.size(); k += stride) {
      if (sp < history[k].y.size()) pts.push_back(to_screen(history[k].t, plot_value(history[k].y[sp], ui.chart_log_scale)));
    }
    const auto& last = history.back();
    if (sp < last.y.size()) pts.push_back(to_screen(last.t, plot_value(last.y[sp], ui.chart_log_scale)));

    const bool dim = extinct.count(static_cast<int>(sp)) > 0;
    if (pts.size() >= 2) dl->AddPolyline(pts.data(), static_cast<int>(pts.size()), species_color(static_cast<int>(sp), dim), 0, dim ? 1.0f : 2.0f);
  }

  dl->PopClipRect();

  ImGui::SetCursorScreenPos(ImVec2(p0.x + 6.0f, p0.y + 4.0f));
  if (ui.chart_log_scale) {
    ImGui::Text("1e%.1f", ymax);
  } else {
    ImGui::Text("%.2f", ymax);
  }
  ImGui::SetCursorScreenPos(ImVec2(p0.x + 6.0f, p1.y - 20.0f));
  ImGui::Text("t = %.1f .. %.1f", t0, t1);

  if (hovered) {
    const float mx = ImGui::GetIO().MousePos.x;
    const double t = t0 + (t1 - t0) * static_cast<double>((mx - p0.x) / plot_size.x);
    auto it = std::lower_bound(history.begin(), history.end(), t,
                               [](const OdeSample& s, double tv) { return s.t < tv; });
    if (it == history.end()) --it;
    ImGui::BeginTooltip();
    ImGui::Text("t = %.3f", it->t);
    for (std::size_t sp = 0; sp < it->y.size(); ++sp) {
      const char* name = sp < labels.size() ? labels[sp].c_str() : "?";
      ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(species_color(static_cast<int>(sp), false)), "%s: %.4f", name,
                         it->y[sp]);
    }
    ImGui::EndTooltip();
  }

  if (ui.chart_show_legend) {
    ImGui::SetCursorScreenPos(ImVec2(p1.x + 8.0f, p0.y));
    ImGui::BeginGroup();
    for (std::size_t sp = 0; sp < n_species; ++sp) {
      const bool dim = extinct.count(static_cast<int>(sp)) > 0;
      const char* name = sp < labels.size() ? labels[sp].c_str() : "?";
      ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(species_color(static_cast<int>(sp), dim)), "%s%s", name,
                         dim ? " (extinct)" : "");
    }
    if (ui.chart_show_markers && !categories.empty()) {
      ImGui::Spacing();
      for (const auto& c : categories) {
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(category_color(c.label, categories)), "| %s", c.label.c_str());
      }
    }
    ImGui::EndGroup();
  }

  ImGui::End();
}

} // namespace tempest::ui
