#pragma once

#include "entt/entt.hpp"
#include <skycarpet/core/config.hpp>
#include <skycarpet/entities/components.hpp>
#include <skycarpet/terrain/terrain_system.hpp>
#include <random>
#include <string>
#include <vector>

namespace skycarpet {
namespace entities {

/**
 * @brief Manages the ECS registry and the terrain-following gameplay systems.
 *
 * The terrain is consulted through the cached height service, so all calls
 * must stay on the thread that owns the TerrainSystem.
 */
class EntityManager {
public:
  EntityManager(terrain::TerrainSystem &terrain, const core::FlightConfig &config);
  ~EntityManager() = default;

  // Lifecycle
  void init();

  // Spawning
  entt::entity spawn_carpet(float x, float z, const std::string &name = "Player");

  /**
   * @brief Scatter mana nodes around a point, hovering above ground or water.
   * @return Number of nodes spawned.
   */
  int spawn_mana_nodes(float center_x, float center_z, int count, float radius);

  // Systems
  void set_carpet_input(entt::entity carpet, const CarpetInput &input);
  void update(double dt);

  /**
   * @brief Collect every uncollected node within radius of the entity.
   * @return Total mana value gathered.
   */
  int collect_mana(entt::entity collector, float radius);

  // Queries
  std::vector<entt::entity> get_entities_in_radius(float x, float y, float z, float radius) const;

  // Accessors
  entt::registry &registry() { return registry_; }
  const entt::registry &registry() const { return registry_; }

  size_t count_mana_remaining() const;

private:
  entt::registry registry_;
  terrain::TerrainSystem &terrain_;
  core::FlightConfig config_;

  // Seeded RNG for deterministic spawning
  std::mt19937 rng_;

  // System methods
  void update_steering(double dt);
  void update_movement(double dt);
  void update_terrain_clearance();
};

} // namespace entities
} // namespace skycarpet
