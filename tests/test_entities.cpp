/**
 * @file test_entities.cpp
 * @brief Unit tests for the carpet and mana ECS systems.
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include <skycarpet/core/config.hpp>
#include <skycarpet/core/constants.hpp>
#include <skycarpet/entities/entity_manager.hpp>
#include <skycarpet/terrain/terrain_system.hpp>

using namespace skycarpet;

namespace {

terrain::TerrainSettings seeded(uint32_t seed) {
  terrain::TerrainSettings s;
  s.height.seed = seed;
  return s;
}

} // namespace

void test_spawn_carpet() {
  std::cout << "Testing carpet spawn..." << std::endl;

  terrain::TerrainSystem terrain(seeded(42));
  core::FlightConfig flight;
  entities::EntityManager manager(terrain, flight);
  manager.init();

  auto carpet = manager.spawn_carpet(120.0f, -40.0f, "Tester");
  auto &reg = manager.registry();
  assert(reg.valid(carpet));
  assert(reg.all_of<entities::Position>(carpet));
  assert(reg.all_of<entities::Carpet>(carpet));
  assert(reg.get<entities::Carpet>(carpet).name == "Tester");

  const auto &pos = reg.get<entities::Position>(carpet);
  double ground = terrain.get_cached_height(120.0f, -40.0f);
  double expected = std::max(ground, constants::SEA_LEVEL) + flight.spawn_height;
  assert(std::abs(pos.y - expected) < 1e-3);

  std::cout << "  Spawn: PASS" << std::endl;
}

void test_flight_and_clearance() {
  std::cout << "Testing carpet flight and terrain clearance..." << std::endl;

  terrain::TerrainSystem terrain(seeded(42));
  core::FlightConfig flight;
  entities::EntityManager manager(terrain, flight);
  manager.init();
  auto carpet = manager.spawn_carpet(0.0f, 0.0f);
  auto &reg = manager.registry();

  // Straight ahead along +z at cruise speed
  entities::CarpetInput input;
  input.thrust = 1.0f;
  manager.set_carpet_input(carpet, input);
  float z_before = reg.get<entities::Position>(carpet).z;
  manager.update(0.5);
  float z_after = reg.get<entities::Position>(carpet).z;
  assert(std::abs((z_after - z_before) - flight.cruise_speed * 0.5) < 1e-3);

  // Inputs are clamped to [-1, 1]
  input.thrust = 5.0f;
  input.turn = -9.0f;
  manager.set_carpet_input(carpet, input);
  assert(reg.get<entities::CarpetInput>(carpet).thrust == 1.0f);
  assert(reg.get<entities::CarpetInput>(carpet).turn == -1.0f);

  // Turning changes heading
  float yaw_before = reg.get<entities::Heading>(carpet).yaw;
  manager.update(0.25);
  assert(reg.get<entities::Heading>(carpet).yaw < yaw_before);

  // Dive hard: the carpet never sinks below the terrain floor
  input = entities::CarpetInput{};
  input.thrust = 1.0f;
  input.climb = -1.0f;
  input.boost = true;
  manager.set_carpet_input(carpet, input);
  for (int i = 0; i < 600; ++i) {
    manager.update(1.0 / 30.0);
    const auto &pos = reg.get<entities::Position>(carpet);
    const auto &clearance = reg.get<entities::TerrainClearance>(carpet);
    double ground = terrain.get_cached_height(pos.x, pos.z);
    double floor_y = std::max(ground, constants::SEA_LEVEL) + flight.min_clearance;
    assert(pos.y >= floor_y - 1e-3);
    assert(std::abs(clearance.ground_height - ground) < 1e-3);
    assert(reg.get<entities::Velocity>(carpet).dy <= 0.0f);
  }

  // Zero or negative time steps change nothing
  auto snapshot = reg.get<entities::Position>(carpet);
  manager.update(0.0);
  manager.update(-1.0);
  assert(reg.get<entities::Position>(carpet).x == snapshot.x);
  assert(reg.get<entities::Position>(carpet).y == snapshot.y);

  std::cout << "  Flight: PASS" << std::endl;
}

void test_mana_nodes() {
  std::cout << "Testing mana nodes..." << std::endl;

  terrain::TerrainSystem terrain(seeded(42));
  core::FlightConfig flight;
  entities::EntityManager a(terrain, flight);
  entities::EntityManager b(terrain, flight);
  a.init();
  b.init();

  assert(a.spawn_mana_nodes(50.0f, 50.0f, 30, 400.0f) == 30);
  assert(b.spawn_mana_nodes(50.0f, 50.0f, 30, 400.0f) == 30);
  assert(a.count_mana_remaining() == 30);
  assert(a.spawn_mana_nodes(0.0f, 0.0f, 0, 100.0f) == 0);

  // Deterministic placement, hovering above ground and water
  std::vector<entities::Position> pa, pb;
  for (auto e : a.registry().view<const entities::ManaNode>()) {
    pa.push_back(a.registry().get<entities::Position>(e));
  }
  for (auto e : b.registry().view<const entities::ManaNode>()) {
    pb.push_back(b.registry().get<entities::Position>(e));
  }
  assert(pa.size() == pb.size());
  for (size_t i = 0; i < pa.size(); ++i) {
    assert(pa[i].x == pb[i].x && pa[i].z == pb[i].z);

    double dx = pa[i].x - 50.0;
    double dz = pa[i].z - 50.0;
    assert(std::sqrt(dx * dx + dz * dz) <= 400.0 + 1e-3);

    double ground = terrain.get_cached_height(pa[i].x, pa[i].z);
    double expected = std::max(ground + constants::MANA_HOVER_HEIGHT,
                               constants::SEA_LEVEL + constants::MANA_HOVER_HEIGHT);
    assert(std::abs(pa[i].y - expected) < 1e-3);
  }

  std::cout << "  Mana nodes: PASS" << std::endl;
}

void test_collect_mana() {
  std::cout << "Testing mana collection..." << std::endl;

  terrain::TerrainSystem terrain(seeded(42));
  core::FlightConfig flight;
  entities::EntityManager manager(terrain, flight);
  manager.init();
  auto carpet = manager.spawn_carpet(0.0f, 0.0f);
  manager.spawn_mana_nodes(0.0f, 0.0f, 10, 300.0f);
  auto &reg = manager.registry();

  // Park the carpet on the first node
  entt::entity target = entt::null;
  for (auto e : reg.view<const entities::ManaNode>()) {
    target = e;
    break;
  }
  assert(target != entt::null);
  reg.get<entities::Position>(carpet) = reg.get<entities::Position>(target);

  int value = reg.get<entities::ManaNode>(target).value;
  int gathered = manager.collect_mana(carpet, 0.5f);
  assert(gathered >= value);
  assert(reg.get<entities::ManaNode>(target).collected);
  assert(reg.get<entities::Carpet>(carpet).mana == gathered);
  assert(manager.count_mana_remaining() < 10);

  // Already collected nodes give nothing
  assert(manager.collect_mana(carpet, 0.5f) == 0);
  assert(manager.collect_mana(entt::null, 10.0f) == 0);

  // Radius query includes the carpet itself
  const auto &pos = reg.get<entities::Position>(carpet);
  auto nearby = manager.get_entities_in_radius(pos.x, pos.y, pos.z, 0.1f);
  assert(std::find(nearby.begin(), nearby.end(), carpet) != nearby.end());

  std::cout << "  Collect: PASS" << std::endl;
}

int main() {
  std::cout << "=== Running Entity Tests ===" << std::endl;

  test_spawn_carpet();
  test_flight_and_clearance();
  test_mana_nodes();
  test_collect_mana();

  std::cout << std::endl;
  std::cout << "All tests PASSED!" << std::endl;
  return 0;
}
