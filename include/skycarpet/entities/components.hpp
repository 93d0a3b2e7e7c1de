#pragma once

#include <skycarpet/core/math.hpp>
#include <string>

namespace skycarpet {
namespace entities {

/**
 * @brief World position (y is up).
 */
struct Position {
  float x;
  float y;
  float z;
};

/**
 * @brief Velocity vector, world units per second.
 */
struct Velocity {
  float dx;
  float dy;
  float dz;
};

/**
 * @brief Yaw around +y, radians. 0 faces +z.
 */
struct Heading {
  float yaw = 0.0f;
};

/**
 * @brief Visual representation.
 */
struct Renderable {
  core::Rgb color;
  float size = 1.0f;
};

/**
 * @brief Tag component for the player's carpet.
 */
struct Carpet {
  std::string name;
  int mana = 0;
};

/**
 * @brief Steering intent, each axis in [-1, 1].
 */
struct CarpetInput {
  float thrust = 0.0f;
  float turn = 0.0f;
  float climb = 0.0f;
  bool boost = false;
};

/**
 * @brief Keeps an entity above the terrain surface.
 */
struct TerrainClearance {
  float min_clearance = 2.0f;
  float ground_height = 0.0f;  // Last sampled surface height below the entity
};

/**
 * @brief Collectible mana orb.
 */
struct ManaNode {
  int value = 1;
  bool collected = false;
};

} // namespace entities
} // namespace skycarpet
