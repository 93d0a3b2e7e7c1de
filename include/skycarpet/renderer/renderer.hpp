#pragma once

/**
 * @file renderer.hpp
 * @brief Raylib-based 3D renderer for the SkyCarpet terrain.
 *
 * Features:
 * - Chase camera following the carpet
 * - Per-chunk GPU models, uploaded and released with chunk streaming
 * - Biome/height/slope overlays
 * - Water plane and entity markers
 */

#include "raylib.h"
#include <string>
#include <unordered_map>
#include <vector>
#include "entt/entt.hpp"

#include <skycarpet/entities/components.hpp>
#include <skycarpet/world/chunk_mesh.hpp>

namespace skycarpet {
namespace renderer {

/**
 * @brief Active overlay type for visualization.
 */
enum class OverlayType { BIOME, HEIGHT, SLOPE };

/**
 * @brief Renderer configuration.
 */
struct RendererConfig {
  int window_width = 1280;
  int window_height = 720;
  std::string title = "SkyCarpet";
  int target_fps = 60;
  float camera_distance = 38.0f;   // Behind the carpet
  float camera_height = 14.0f;     // Above the carpet
  float water_extent = 4096.0f;    // Water plane edge length
};

/**
 * @brief GPU-side copy of one chunk plus the data needed to recolor it.
 */
struct ChunkModel {
  Model model{};
  Vector3 origin{};
  std::vector<unsigned char> biome_colors;  // RGBA, lit
  std::vector<float> heights;
  std::vector<float> slopes;
  std::vector<float> light;
};

/**
 * @brief Terrain visualization renderer.
 */
class Renderer {
public:
  Renderer() = default;
  ~Renderer() = default;

  // Lifecycle
  void init(const RendererConfig &config);
  void shutdown();
  bool should_close() const;

  // Input handling
  void update_input(bool mouse_captured = false);
  entities::CarpetInput read_carpet_input() const;

  // Chunk streaming hooks
  void upload_chunk(const world::ChunkMesh &mesh);
  void release_chunk(world::ChunkCoord coord);
  void release_all_chunks();

  // Rendering
  void follow(const entities::Position &pos, const entities::Heading &heading);
  void begin_frame();
  void draw_terrain();
  void draw_entities(const entt::registry &registry);
  void draw_hud();
  void end_frame();

  // State accessors
  bool is_paused() const { return paused_; }
  size_t uploaded_count() const { return chunks_.size(); }

private:
  RendererConfig config_;
  Camera3D camera_{};
  bool initialized_ = false;

  OverlayType active_overlay_ = OverlayType::BIOME;
  bool paused_ = false;
  float zoom_ = 1.0f;

  std::unordered_map<world::ChunkCoord, ChunkModel, world::ChunkCoordHash> chunks_;

  // Internal helpers
  void handle_camera_input();
  void handle_overlay_input();
  void recolor_chunks();
  void fill_overlay_colors(const ChunkModel &chunk, unsigned char *out) const;
};

// === Inline implementations ===

inline bool Renderer::should_close() const { return WindowShouldClose(); }

} // namespace renderer
} // namespace skycarpet
