#include <skycarpet/entities/entity_manager.hpp>
#include <skycarpet/core/constants.hpp>

#include <algorithm>
#include <cmath>

namespace skycarpet {
namespace entities {

EntityManager::EntityManager(terrain::TerrainSystem &terrain,
                             const core::FlightConfig &config)
    : terrain_(terrain), config_(config) {
  rng_.seed(config_.mana_seed);
}

void EntityManager::init() {
  registry_.clear();
  rng_.seed(config_.mana_seed);
}

entt::entity EntityManager::spawn_carpet(float x, float z, const std::string &name) {
  auto entity = registry_.create();

  float ground = static_cast<float>(terrain_.get_cached_height(x, z));
  float base = std::max(ground, static_cast<float>(constants::SEA_LEVEL));
  float y = base + static_cast<float>(config_.spawn_height);

  registry_.emplace<Position>(entity, x, y, z);
  registry_.emplace<Velocity>(entity, 0.0f, 0.0f, 0.0f);
  registry_.emplace<Heading>(entity);
  registry_.emplace<Carpet>(entity, name);
  registry_.emplace<CarpetInput>(entity);
  registry_.emplace<TerrainClearance>(entity, static_cast<float>(config_.min_clearance), ground);
  registry_.emplace<Renderable>(entity, core::Rgb{0.72, 0.12, 0.18}, 3.0f);

  return entity;
}

int EntityManager::spawn_mana_nodes(float center_x, float center_z, int count,
                                    float radius) {
  std::uniform_real_distribution<float> dist_angle(0.0f, 6.2831853f);
  std::uniform_real_distribution<float> dist_radius(0.0f, 1.0f);
  std::uniform_int_distribution<int> dist_value(1, 5);

  int spawned = 0;
  for (int i = 0; i < count; ++i) {
    float angle = dist_angle(rng_);
    // sqrt keeps the scatter uniform over the disc
    float r = radius * std::sqrt(dist_radius(rng_));
    float x = center_x + r * std::cos(angle);
    float z = center_z + r * std::sin(angle);

    double ground = terrain_.get_cached_height(x, z);
    double y = std::max(ground + constants::MANA_HOVER_HEIGHT,
                        constants::SEA_LEVEL + constants::MANA_HOVER_HEIGHT);

    auto entity = registry_.create();
    registry_.emplace<Position>(entity, x, static_cast<float>(y), z);
    int value = dist_value(rng_);
    registry_.emplace<ManaNode>(entity, value, false);
    registry_.emplace<Renderable>(entity, core::Rgb{0.35, 0.55, 1.0}, 1.0f + 0.25f * value);
    ++spawned;
  }
  return spawned;
}

void EntityManager::set_carpet_input(entt::entity carpet, const CarpetInput &input) {
  if (!registry_.valid(carpet) || !registry_.all_of<CarpetInput>(carpet)) return;
  CarpetInput clamped = input;
  clamped.thrust = std::clamp(input.thrust, -1.0f, 1.0f);
  clamped.turn = std::clamp(input.turn, -1.0f, 1.0f);
  clamped.climb = std::clamp(input.climb, -1.0f, 1.0f);
  registry_.replace<CarpetInput>(carpet, clamped);
}

void EntityManager::update(double dt) {
  if (!(dt > 0.0)) return;
  update_steering(dt);
  update_movement(dt);
  update_terrain_clearance();
}

void EntityManager::update_steering(double dt) {
  auto view = registry_.view<const CarpetInput, Heading, Velocity>();
  const core::FlightConfig &cfg = config_;
  float dt_float = static_cast<float>(dt);

  view.each([&cfg, dt_float](const CarpetInput &input, Heading &heading, Velocity &vel) {
    heading.yaw += input.turn * static_cast<float>(cfg.turn_rate) * dt_float;

    float speed = static_cast<float>(input.boost ? cfg.boost_speed : cfg.cruise_speed);
    float forward = input.thrust * speed;
    vel.dx = std::sin(heading.yaw) * forward;
    vel.dz = std::cos(heading.yaw) * forward;
    vel.dy = input.climb * static_cast<float>(cfg.climb_rate);
  });
}

void EntityManager::update_movement(double dt) {
  auto view = registry_.view<Position, const Velocity>();

  // Simple Euler integration
  float dt_float = static_cast<float>(dt);

  view.each([dt_float](Position &pos, const Velocity &vel) {
    pos.x += vel.dx * dt_float;
    pos.y += vel.dy * dt_float;
    pos.z += vel.dz * dt_float;
  });
}

void EntityManager::update_terrain_clearance() {
  auto view = registry_.view<Position, Velocity, TerrainClearance>();

  for (auto entity : view) {
    auto &pos = view.get<Position>(entity);
    auto &vel = view.get<Velocity>(entity);
    auto &clearance = view.get<TerrainClearance>(entity);

    double ground = terrain_.get_cached_height(pos.x, pos.z);
    clearance.ground_height = static_cast<float>(ground);

    float floor_y = static_cast<float>(std::max(ground, constants::SEA_LEVEL)) +
                    clearance.min_clearance;
    if (pos.y < floor_y) {
      pos.y = floor_y;
      if (vel.dy < 0.0f) vel.dy = 0.0f;
    }
  }
}

int EntityManager::collect_mana(entt::entity collector, float radius) {
  if (!registry_.valid(collector) || !registry_.all_of<Position>(collector)) return 0;

  const auto &pos = registry_.get<Position>(collector);
  int gathered = 0;
  for (auto entity : get_entities_in_radius(pos.x, pos.y, pos.z, radius)) {
    auto *node = registry_.try_get<ManaNode>(entity);
    if (!node || node->collected) continue;
    node->collected = true;
    gathered += node->value;
  }

  if (auto *carpet = registry_.try_get<Carpet>(collector)) {
    carpet->mana += gathered;
  }
  return gathered;
}

std::vector<entt::entity> EntityManager::get_entities_in_radius(float x, float y, float z,
                                                                 float radius) const {
  std::vector<entt::entity> result;
  float r_sq = radius * radius;
  auto view = registry_.view<const Position>();

  for (auto entity : view) {
    const auto &pos = view.get<const Position>(entity);
    float dx = pos.x - x;
    float dy = pos.y - y;
    float dz = pos.z - z;

    if (dx * dx + dy * dy + dz * dz <= r_sq) {
      result.push_back(entity);
    }
  }

  return result;
}

size_t EntityManager::count_mana_remaining() const {
  size_t count = 0;
  auto view = registry_.view<const ManaNode>();
  for (auto entity : view) {
    if (!view.get<const ManaNode>(entity).collected) ++count;
  }
  return count;
}

} // namespace entities
} // namespace skycarpet
