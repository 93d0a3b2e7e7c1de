#pragma once

/**
 * @file debug_ui.hpp
 * @brief Terrain inspection sidebar built on Dear ImGui.
 *
 * Shows the carpet state, the terrain under it, height cache and chunk
 * streaming statistics, world regeneration controls and an event log.
 */

#include <cstdint>
#include <deque>
#include <string>
#include "entt/entt.hpp"

namespace skycarpet {
namespace terrain {
class TerrainSystem;
}
namespace world {
class ChunkManager;
}
} // namespace skycarpet

namespace skycarpet {
namespace renderer {

/**
 * @brief Log entry for the event log.
 */
struct LogEntry {
  double sim_time;
  std::string message;
  int severity; // 0=info, 1=warning, 2=error
};

/**
 * @brief Requests raised from the sidebar during a frame.
 */
struct SidebarActions {
  bool regenerate = false;
  uint32_t seed = 0;
  bool clear_cache = false;
};

/**
 * @brief Unified left sidebar.
 */
class DebugUI {
public:
  DebugUI() = default;
  ~DebugUI() = default;

  // Lifecycle
  void init();
  void shutdown();

  // Frame management
  void begin_frame();
  void end_frame();

  SidebarActions draw_sidebar(terrain::TerrainSystem &terrain,
                              const world::ChunkManager &chunks,
                              const entt::registry &registry, entt::entity carpet,
                              bool paused, double sim_time);

  // Logging
  void add_log(double sim_time, const std::string &message, int severity = 0);
  void clear_log();

  bool is_capturing_mouse() const;

  void toggle_log() { show_log_ = !show_log_; }

private:
  bool initialized_ = false;
  bool show_log_ = true;

  // Log storage
  std::deque<LogEntry> log_entries_;
  static constexpr size_t MAX_LOG_ENTRIES = 200;
  bool auto_scroll_log_ = true;

  int seed_input_ = 42;
};

} // namespace renderer
} // namespace skycarpet
