/**
 * @file main.cpp
 * @brief Entry point for the SkyCarpet terrain viewer.
 */

#include <algorithm>
#include <iostream>
#include <string>

#include "raylib.h"

#include <skycarpet/core/config.hpp>
#include <skycarpet/entities/entity_manager.hpp>
#include <skycarpet/renderer/debug_ui.hpp>
#include <skycarpet/renderer/renderer.hpp>
#include <skycarpet/terrain/terrain_system.hpp>
#include <skycarpet/world/chunk_manager.hpp>
#include <skycarpet/world/mesh_builder.hpp>

using namespace skycarpet;

int main(int argc, char **argv) {
  std::cout << "=== SkyCarpet Terrain Viewer ===" << std::endl;
  std::cout << "Initializing systems..." << std::endl;

  // Configuration
  std::string config_path = argc > 1 ? argv[1] : "skycarpet.cfg";
  core::WorldConfig config;
  if (!core::load_config_file(config_path, config)) {
    std::cout << "[WARN] Config: using built-in defaults" << std::endl;
  }
  auto config_warnings = core::sanitize(config);
  for (const auto &warning : config_warnings) {
    std::cout << "[WARN] Config: " << warning << std::endl;
  }

  // Terrain core
  terrain::TerrainSystem terrain(config.terrain);
  std::cout << "[OK] Terrain: seed " << terrain.seed() << ", cache "
            << config.terrain.cache.max_cache_size << " entries @ R="
            << config.terrain.cache.resolution << std::endl;

  world::ChunkMeshBuilder builder(terrain, config.mesh, config.smoothing);
  world::ChunkManager chunk_manager(builder, config.chunks);
  std::cout << "[OK] World: " << builder.resolution() << "x" << builder.resolution()
            << " vertices per " << builder.chunk_size() << "u chunk, view distance "
            << config.chunks.view_distance << std::endl;

  // Initialize Renderer
  renderer::RendererConfig render_config;
  render_config.title = "SkyCarpet";
  render_config.water_extent = static_cast<float>(
      builder.chunk_size() * (2 * config.chunks.view_distance + 3));

  renderer::Renderer game_renderer;
  game_renderer.init(render_config);
  std::cout << "[OK] Renderer: " << render_config.window_width << "x"
            << render_config.window_height << " window" << std::endl;

  // Initialize Debug UI
  renderer::DebugUI debug_ui;
  debug_ui.init();
  std::cout << "[OK] Debug UI: Dear ImGui initialized" << std::endl;
  for (const auto &warning : config_warnings) {
    debug_ui.add_log(0.0, warning, 1);
  }

  // Chunk meshes go to the GPU as they stream in and out
  chunk_manager.on_chunk_loaded(
      [&game_renderer](const world::ChunkMesh &mesh) { game_renderer.upload_chunk(mesh); });
  chunk_manager.on_chunk_unloaded(
      [&game_renderer](world::ChunkCoord coord) { game_renderer.release_chunk(coord); });

  // Initialize Entity Manager (ECS)
  entities::EntityManager entity_manager(terrain, config.flight);
  entity_manager.init();
  entt::entity carpet = entity_manager.spawn_carpet(0.0f, 0.0f, "Player");
  int mana = entity_manager.spawn_mana_nodes(0.0f, 0.0f, config.flight.mana_count,
                                             static_cast<float>(config.flight.mana_radius));
  std::cout << "[OK] ECS: EnTT initialized, carpet + " << mana << " mana nodes spawned"
            << std::endl;

  // Build the chunk under the player before the first frame
  chunk_manager.update(0.0, 0.0);
  std::cout << "[OK] World: " << chunk_manager.loaded_count() << " chunks loaded, "
            << chunk_manager.pending_count() << " pending" << std::endl;
  std::cout << std::endl;
  std::cout << "=== Flight Running ===" << std::endl;
  std::cout << "Controls:" << std::endl;
  std::cout << "  W/S: Thrust   A/D: Turn" << std::endl;
  std::cout << "  Space/C: Climb/Dive   Shift: Boost" << std::endl;
  std::cout << "  1/2/0: Overlay (Height/Slope/Biome)" << std::endl;
  std::cout << "  P: Pause   F3: Toggle event log" << std::endl;
  std::cout << std::endl;

  // Fixed timestep
  const double fixed_dt = 1.0 / 60.0;
  const int max_steps_per_frame = 5;
  double accumulator = 0.0;
  double sim_time = 0.0;

  debug_ui.add_log(sim_time, "World ready, seed " + std::to_string(terrain.seed()));

  while (!game_renderer.should_close()) {
    if (IsKeyPressed(KEY_F3))
      debug_ui.toggle_log();

    game_renderer.update_input(debug_ui.is_capturing_mouse());
    entity_manager.set_carpet_input(carpet, game_renderer.read_carpet_input());

    if (!game_renderer.is_paused()) {
      accumulator += static_cast<double>(GetFrameTime());
    }

    int steps = 0;
    while (accumulator >= fixed_dt && steps < max_steps_per_frame) {
      entity_manager.update(fixed_dt);
      int gathered = entity_manager.collect_mana(
          carpet, static_cast<float>(config.flight.collect_radius));
      if (gathered > 0) {
        debug_ui.add_log(sim_time, "Collected " + std::to_string(gathered) + " mana");
      }
      accumulator -= fixed_dt;
      sim_time += fixed_dt;
      ++steps;
    }
    // Drop backlog after a long stall
    if (steps == max_steps_per_frame) accumulator = 0.0;

    const auto &pos = entity_manager.registry().get<entities::Position>(carpet);
    const auto &heading = entity_manager.registry().get<entities::Heading>(carpet);

    size_t loaded_before = chunk_manager.loaded_count();
    chunk_manager.update(pos.x, pos.z);
    if (chunk_manager.loaded_count() != loaded_before && chunk_manager.pending_count() == 0) {
      debug_ui.add_log(sim_time, "Chunks settled: " +
                                     std::to_string(chunk_manager.loaded_count()) + " loaded");
    }

    game_renderer.follow(pos, heading);

    // Render
    game_renderer.begin_frame();
    game_renderer.draw_terrain();
    game_renderer.draw_entities(entity_manager.registry());
    game_renderer.draw_hud();

    debug_ui.begin_frame();
    renderer::SidebarActions actions =
        debug_ui.draw_sidebar(terrain, chunk_manager, entity_manager.registry(), carpet,
                              game_renderer.is_paused(), sim_time);
    debug_ui.end_frame();

    game_renderer.end_frame();

    if (actions.clear_cache) {
      terrain.clear_cache();
      debug_ui.add_log(sim_time, "Height cache cleared");
    }
    if (actions.regenerate) {
      float x = pos.x;
      float z = pos.z;
      terrain.regenerate(actions.seed);
      chunk_manager.clear();

      entity_manager.init();
      carpet = entity_manager.spawn_carpet(x, z, "Player");
      entity_manager.spawn_mana_nodes(x, z, config.flight.mana_count,
                                      static_cast<float>(config.flight.mana_radius));
      debug_ui.add_log(sim_time, "Regenerated world with seed " + std::to_string(actions.seed));
      std::cout << "[OK] World regenerated, seed " << actions.seed << std::endl;
    }
  }

  std::cout << "Shutting down..." << std::endl;
  debug_ui.shutdown();
  game_renderer.shutdown();
  std::cout << "Goodbye!" << std::endl;

  return 0;
}
