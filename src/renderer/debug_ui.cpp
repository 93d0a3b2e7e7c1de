/**
 * @file debug_ui.cpp
 * @brief Sidebar UI implementation.
 */

#include <skycarpet/renderer/debug_ui.hpp>
#include <skycarpet/entities/components.hpp>
#include <skycarpet/terrain/terrain_system.hpp>
#include <skycarpet/world/chunk_manager.hpp>

#include "imgui.h"
#include "rlImGui.h"
#include "raylib.h"

#include <algorithm>

namespace skycarpet {
namespace renderer {

void DebugUI::init() {
  rlImGuiSetup(true);
  initialized_ = true;

  ImGuiStyle &style = ImGui::GetStyle();
  style.WindowRounding = 0.0f;
  style.FrameRounding = 2.0f;
  style.GrabRounding = 2.0f;
  style.WindowPadding = ImVec2(8, 8);
  style.FramePadding = ImVec2(4, 2);
  style.ItemSpacing = ImVec2(6, 4);
  style.WindowBorderSize = 1.0f;

  // Dusk palette: deep indigo panels, gold text
  ImVec4 *colors = style.Colors;
  colors[ImGuiCol_WindowBg] = ImVec4(0.07f, 0.06f, 0.14f, 0.94f);
  colors[ImGuiCol_ChildBg] = ImVec4(0.05f, 0.04f, 0.10f, 1.00f);
  colors[ImGuiCol_Border] = ImVec4(0.45f, 0.35f, 0.60f, 0.60f);
  colors[ImGuiCol_FrameBg] = ImVec4(0.12f, 0.10f, 0.22f, 1.00f);
  colors[ImGuiCol_FrameBgHovered] = ImVec4(0.20f, 0.16f, 0.34f, 1.00f);
  colors[ImGuiCol_Text] = ImVec4(0.95f, 0.85f, 0.55f, 1.00f);
  colors[ImGuiCol_TextDisabled] = ImVec4(0.55f, 0.50f, 0.40f, 1.00f);
  colors[ImGuiCol_Button] = ImVec4(0.30f, 0.12f, 0.22f, 1.00f);
  colors[ImGuiCol_ButtonHovered] = ImVec4(0.45f, 0.18f, 0.30f, 1.00f);
  colors[ImGuiCol_ButtonActive] = ImVec4(0.60f, 0.22f, 0.36f, 1.00f);
  colors[ImGuiCol_Header] = ImVec4(0.16f, 0.14f, 0.32f, 1.00f);
  colors[ImGuiCol_HeaderHovered] = ImVec4(0.24f, 0.20f, 0.44f, 1.00f);
  colors[ImGuiCol_PlotHistogram] = ImVec4(0.40f, 0.60f, 0.95f, 1.00f);
}

void DebugUI::shutdown() {
  if (initialized_) {
    rlImGuiShutdown();
    initialized_ = false;
  }
}

void DebugUI::begin_frame() { rlImGuiBegin(); }
void DebugUI::end_frame() { rlImGuiEnd(); }

SidebarActions DebugUI::draw_sidebar(terrain::TerrainSystem &terrain,
                                     const world::ChunkManager &chunks,
                                     const entt::registry &registry,
                                     entt::entity carpet, bool paused,
                                     double sim_time) {
  SidebarActions actions;

  float sidebar_width = 260.0f;
  ImGui::SetNextWindowPos(ImVec2(0, 0), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(sidebar_width, static_cast<float>(GetScreenHeight())),
                           ImGuiCond_Always);

  ImGuiWindowFlags flags = ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize |
                           ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoTitleBar;

  if (ImGui::Begin("##Sidebar", nullptr, flags)) {
    ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.55f, 0.75f, 1.0f, 1.0f));
    ImGui::Text("SKYCARPET");
    ImGui::PopStyleColor();
    ImGui::SameLine(sidebar_width - 90);
    if (paused)
      ImGui::TextDisabled("PAUSED");
    else
      ImGui::TextDisabled("t=%.0fs", sim_time);
    ImGui::Separator();

    // === CARPET ===
    if (ImGui::CollapsingHeader("Carpet", ImGuiTreeNodeFlags_DefaultOpen)) {
      if (registry.valid(carpet) && registry.all_of<entities::Position>(carpet)) {
        const auto &pos = registry.get<entities::Position>(carpet);
        ImGui::Text("Pos: %.0f, %.0f, %.0f", pos.x, pos.y, pos.z);

        if (const auto *clearance = registry.try_get<entities::TerrainClearance>(carpet)) {
          ImGui::Text("Ground: %.1f  AGL: %.1f", clearance->ground_height,
                      pos.y - clearance->ground_height);
        }
        if (const auto *state = registry.try_get<entities::Carpet>(carpet)) {
          ImGui::Text("Mana: %d", state->mana);
        }

        // Terrain probe under the carpet
        double height = terrain.get_cached_height(pos.x, pos.z);
        double slope = terrain.get_slope(pos.x, pos.z);
        double mask = terrain.continent_mask(pos.x, pos.z);
        core::Rgb c = terrain.get_biome_color(pos.x, pos.z, height, slope);
        ImGui::Text("Height: %.2f  Slope: %.3f", height, slope);
        ImGui::Text("Continent: %.3f", mask);
        ImGui::ColorButton("##biome", ImVec4(static_cast<float>(c.r), static_cast<float>(c.g),
                                             static_cast<float>(c.b), 1.0f),
                           ImGuiColorEditFlags_NoTooltip, ImVec2(16, 16));
        ImGui::SameLine();
        ImGui::Text("Biome %.2f %.2f %.2f", c.r, c.g, c.b);
      } else {
        ImGui::TextDisabled("No carpet");
      }
    }

    // === HEIGHT CACHE ===
    if (ImGui::CollapsingHeader("Height Cache", ImGuiTreeNodeFlags_DefaultOpen)) {
      terrain::CacheStats stats = terrain.get_cache_stats();
      const auto &cfg = terrain.height_cache().config();
      ImGui::Text("Entries: %zu / %zu", stats.size, cfg.max_cache_size);
      ImGui::Text("Hits: %llu  Misses: %llu", static_cast<unsigned long long>(stats.hits),
                  static_cast<unsigned long long>(stats.misses));
      ImGui::ProgressBar(static_cast<float>(stats.hit_rate), ImVec2(-1, 8), "");
      ImGui::TextDisabled("Hit rate %.1f%%  R=%.2f", stats.hit_rate * 100.0, cfg.resolution);
      if (ImGui::Button("Clear cache"))
        actions.clear_cache = true;
    }

    // === CHUNKS ===
    if (ImGui::CollapsingHeader("Chunks", ImGuiTreeNodeFlags_DefaultOpen)) {
      const auto &build = chunks.build_stats();
      world::ChunkCoord pc = chunks.player_chunk();
      ImGui::Text("Loaded: %zu  Pending: %zu", chunks.loaded_count(), chunks.pending_count());
      ImGui::Text("Player chunk: %d, %d", pc.x, pc.z);
      ImGui::Text("Build: %.1f ms (avg %.1f)", build.last_build_ms, build.avg_build_ms);
      size_t vertices = 0;
      for (const world::ChunkMesh *mesh : chunks.get_loaded_chunks())
        vertices += mesh->vertex_count();
      ImGui::Text("Vertices: %zu", vertices);
      ImGui::TextDisabled("View distance %d", chunks.config().view_distance);
    }

    // === WORLD ===
    if (ImGui::CollapsingHeader("World", ImGuiTreeNodeFlags_DefaultOpen)) {
      ImGui::Text("Seed: %u", terrain.seed());
      ImGui::InputInt("##seed", &seed_input_);
      seed_input_ = std::max(0, seed_input_);
      ImGui::SameLine();
      if (ImGui::Button("Regenerate")) {
        actions.regenerate = true;
        actions.seed = static_cast<uint32_t>(seed_input_);
      }
    }

    // === PERFORMANCE ===
    if (ImGui::CollapsingHeader("Performance")) {
      ImGui::Text("FPS: %d", GetFPS());
      ImGui::Text("Frame: %.1f ms", GetFrameTime() * 1000.0f);

      static float frame_times[60] = {0};
      static int idx = 0;
      frame_times[idx] = GetFrameTime() * 1000.0f;
      idx = (idx + 1) % 60;
      ImGui::PlotLines("##ft", frame_times, 60, idx, nullptr, 0, 33.3f, ImVec2(-1, 30));
    }

    // === CONTROLS HELP ===
    if (ImGui::CollapsingHeader("Controls")) {
      ImGui::TextDisabled("W/S: Thrust  A/D: Turn");
      ImGui::TextDisabled("Space/C: Climb/Dive");
      ImGui::TextDisabled("Shift: Boost  P: Pause");
      ImGui::TextDisabled("1/2/0: Height/Slope/Biome");
      ImGui::TextDisabled("Mouse Wheel: Camera distance");
      ImGui::TextDisabled("F3: Event log");
    }

    // === LOG ===
    if (show_log_ && ImGui::CollapsingHeader("Event Log", ImGuiTreeNodeFlags_DefaultOpen)) {
      ImGui::BeginChild("##log", ImVec2(-1, 140), true);
      for (const auto &entry : log_entries_) {
        ImVec4 col = entry.severity == 2 ? ImVec4(1, 0.3f, 0.3f, 1) :
                     entry.severity == 1 ? ImVec4(1, 0.8f, 0.2f, 1) :
                                           ImVec4(0.7f, 0.7f, 0.7f, 1);
        ImGui::TextColored(col, "[%.0f] %s", entry.sim_time, entry.message.c_str());
      }
      if (auto_scroll_log_) ImGui::SetScrollHereY(1.0f);
      ImGui::EndChild();
      if (ImGui::SmallButton("Clear log"))
        clear_log();
    }
  }
  ImGui::End();

  return actions;
}

void DebugUI::add_log(double sim_time, const std::string &message, int severity) {
  log_entries_.push_back({sim_time, message, severity});
  if (log_entries_.size() > MAX_LOG_ENTRIES) {
    log_entries_.pop_front();
  }
}

void DebugUI::clear_log() { log_entries_.clear(); }

bool DebugUI::is_capturing_mouse() const {
  return initialized_ && ImGui::GetIO().WantCaptureMouse;
}

} // namespace renderer
} // namespace skycarpet
