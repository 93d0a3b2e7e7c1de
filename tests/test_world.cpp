/**
 * @file test_world.cpp
 * @brief Unit tests for chunk meshes, normal smoothing and chunk streaming.
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

#include <skycarpet/terrain/terrain_system.hpp>
#include <skycarpet/world/chunk_manager.hpp>
#include <skycarpet/world/chunk_mesh.hpp>
#include <skycarpet/world/mesh_builder.hpp>
#include <skycarpet/world/normal_smoothing.hpp>

using namespace skycarpet;

namespace {

terrain::TerrainSettings seeded(uint32_t seed) {
  terrain::TerrainSettings s;
  s.height.seed = seed;
  return s;
}

// Grid mesh with the same layout the builder produces
world::ChunkMesh grid_mesh(int res, double spacing, double (*height)(int, int)) {
  world::ChunkMesh mesh;
  mesh.resolution = res;
  mesh.chunk_size = spacing * (res - 1);
  for (int j = 0; j < res; ++j) {
    for (int i = 0; i < res; ++i) {
      world::Vertex v;
      v.position = {i * spacing, height(i, j), j * spacing};
      mesh.vertices.push_back(v);
    }
  }
  for (int j = 0; j < res - 1; ++j) {
    for (int i = 0; i < res - 1; ++i) {
      uint32_t a = static_cast<uint32_t>(j * res + i);
      uint32_t b = a + 1;
      uint32_t c = a + static_cast<uint32_t>(res);
      uint32_t d = c + 1;
      mesh.indices.insert(mesh.indices.end(), {a, c, b, b, c, d});
    }
  }
  return mesh;
}

double ramp_height(int i, int) { return 130.0 + 100.0 * i; }
double flat_height(int, int) { return 5.0; }

void assert_unit_normals(const world::ChunkMesh &mesh) {
  for (const auto &v : mesh.vertices) {
    assert(v.normal.is_finite());
    assert(std::abs(v.normal.length() - 1.0) < 1e-4);
  }
}

} // namespace

void test_mesh_layout() {
  std::cout << "Testing chunk mesh layout..." << std::endl;

  terrain::TerrainSystem terrain(seeded(42));
  world::ChunkMeshConfig cfg;
  cfg.chunk_size = 128.0;
  cfg.terrain_resolution = 16;
  world::ChunkMeshBuilder builder(terrain, cfg);

  world::ChunkMesh mesh = builder.build_chunk(2, -3);
  assert(mesh.resolution == 16);
  assert(mesh.vertex_count() == 256);
  assert(mesh.indices.size() == 15u * 15u * 6u);
  assert(mesh.coord.x == 2 && mesh.coord.z == -3);
  assert(std::abs(mesh.origin_x - 256.0) < 1e-9);
  assert(std::abs(mesh.origin_z + 384.0) < 1e-9);

  for (uint32_t idx : mesh.indices) {
    assert(idx < mesh.vertex_count());
  }

  // Local x/z, world height in y, sampled through the cache
  for (int j = 0; j < 16; ++j) {
    for (int i = 0; i < 16; ++i) {
      const auto &v = mesh.at(i, j);
      assert(std::abs(v.position.x - i * builder.step()) < 1e-9);
      assert(std::abs(v.position.z - j * builder.step()) < 1e-9);
      double wx = builder.lattice_to_world(2, i);
      double wz = builder.lattice_to_world(-3, j);
      assert(v.position.y == terrain.get_cached_height(wx, wz));
      assert(v.color.r >= 0.0 && v.color.r <= 1.0);
    }
  }
  assert(std::abs(mesh.at(15, 0).position.x - 128.0) < 1e-9);

  // Every triangle faces +y
  for (size_t t = 0; t < mesh.indices.size(); t += 3) {
    const auto &p0 = mesh.vertices[mesh.indices[t]].position;
    const auto &p1 = mesh.vertices[mesh.indices[t + 1]].position;
    const auto &p2 = mesh.vertices[mesh.indices[t + 2]].position;
    assert((p1 - p0).cross(p2 - p0).y > 0.0);
  }

  assert_unit_normals(mesh);
  for (const auto &v : mesh.vertices) {
    assert(v.normal.y > 0.0);
  }

  std::cout << "  Layout: PASS" << std::endl;
}

void test_flatten_buffers() {
  std::cout << "Testing renderer hand-off buffers..." << std::endl;

  terrain::TerrainSystem terrain(seeded(3));
  world::ChunkMeshConfig cfg;
  cfg.chunk_size = 64.0;
  cfg.terrain_resolution = 9;
  world::ChunkMeshBuilder builder(terrain, cfg);
  world::ChunkMesh mesh = builder.build_chunk(0, 0);

  auto positions = mesh.flatten_positions();
  auto normals = mesh.flatten_normals();
  auto colors = mesh.flatten_colors();
  assert(positions.size() == mesh.vertex_count() * 3);
  assert(normals.size() == mesh.vertex_count() * 3);
  assert(colors.size() == mesh.vertex_count() * 3);

  for (size_t k = 0; k < mesh.vertex_count(); ++k) {
    const auto &v = mesh.vertices[k];
    assert(positions[k * 3 + 1] == static_cast<float>(v.position.y));
    assert(normals[k * 3 + 2] == static_cast<float>(v.normal.z));
    assert(colors[k * 3] == static_cast<float>(v.color.r));
  }

  std::cout << "  Flatten: PASS" << std::endl;
}

void test_resolution_clamp() {
  std::cout << "Testing resolution limits..." << std::endl;

  terrain::TerrainSystem terrain(seeded(42));
  world::ChunkMeshConfig cfg;

  cfg.terrain_resolution = 1;
  world::ChunkMeshBuilder low(terrain, cfg);
  assert(low.resolution() == 2);
  world::ChunkMesh tiny = low.build_chunk(0, 0);
  assert(tiny.vertex_count() == 4);
  assert(tiny.triangle_count() == 2);
  assert_unit_normals(tiny);

  cfg.terrain_resolution = 5000;
  world::ChunkMeshBuilder high(terrain, cfg);
  assert(high.resolution() == 256);

  cfg.terrain_resolution = 8;
  cfg.chunk_size = -10.0;
  world::ChunkMeshBuilder fallback(terrain, cfg);
  assert(fallback.chunk_size() == world::ChunkMeshConfig{}.chunk_size);

  std::cout << "  Resolution: PASS" << std::endl;
}

void test_chunk_seams() {
  std::cout << "Testing chunk seams..." << std::endl;

  terrain::TerrainSystem terrain(seeded(42));
  world::ChunkMeshConfig cfg;
  cfg.chunk_size = 1024.0;
  cfg.terrain_resolution = 64;
  world::ChunkMeshBuilder builder(terrain, cfg);

  world::ChunkMesh left = builder.build_chunk(0, 0);
  world::ChunkMesh right = builder.build_chunk(1, 0);
  world::ChunkMesh below = builder.build_chunk(0, 1);
  const int last = builder.resolution() - 1;

  for (int j = 0; j <= last; ++j) {
    const auto &a = left.at(last, j);
    const auto &b = right.at(0, j);
    assert(std::abs(a.position.y - b.position.y) < 1e-3);
    assert(std::abs(a.color.r - b.color.r) < 1e-3);
    assert(std::abs(a.color.g - b.color.g) < 1e-3);
    assert(std::abs(a.color.b - b.color.b) < 1e-3);

    // Same world position once chunk origins are added back
    assert(std::abs((left.origin_x + a.position.x) - (right.origin_x + b.position.x)) < 1e-6);
  }

  for (int i = 0; i <= last; ++i) {
    const auto &a = left.at(i, last);
    const auto &b = below.at(i, 0);
    assert(std::abs(a.position.y - b.position.y) < 1e-3);
    assert(std::abs(a.color.g - b.color.g) < 1e-3);
  }

  std::cout << "  Seams: PASS" << std::endl;
}

void test_normals_on_terrain() {
  std::cout << "Testing normals on generated chunks..." << std::endl;

  terrain::TerrainSystem terrain(seeded(42));
  world::ChunkMeshConfig cfg;
  cfg.chunk_size = 512.0;
  cfg.terrain_resolution = 24;
  world::ChunkMeshBuilder builder(terrain, cfg);

  for (int cz = -2; cz <= 2; ++cz) {
    for (int cx = -2; cx <= 2; ++cx) {
      world::ChunkMesh mesh = builder.build_chunk(cx * 37, cz * 53);
      assert_unit_normals(mesh);
      assert(builder.last_smoothing_stats().degenerate == 0);
      assert(builder.last_smoothing_stats().flagged <= mesh.vertex_count());
      for (const auto &v : mesh.vertices) {
        assert(std::isfinite(v.position.y));
      }
    }
  }

  std::cout << "  Terrain normals: PASS" << std::endl;
}

void test_degenerate_normals() {
  std::cout << "Testing degenerate normal fallback..." << std::endl;

  world::NormalSmoothingConfig cfg;

  // Every vertex at the same point: zero-area triangles
  world::ChunkMesh collapsed = grid_mesh(3, 0.0, flat_height);
  world::NormalSmoothingStats stats = world::compute_smoothed_normals(collapsed, cfg);
  assert(stats.degenerate == collapsed.vertex_count());
  for (const auto &v : collapsed.vertices) {
    assert(v.normal.x == 0.0 && v.normal.y == 1.0 && v.normal.z == 0.0);
  }

  // NaN and infinite heights never leak into normals
  world::ChunkMesh poisoned = grid_mesh(4, 2.0, flat_height);
  poisoned.vertices[5].position.y = std::numeric_limits<double>::quiet_NaN();
  poisoned.vertices[10].position.y = std::numeric_limits<double>::infinity();
  world::compute_smoothed_normals(poisoned, cfg);
  assert_unit_normals(poisoned);

  // Out-of-range indices are skipped
  world::ChunkMesh broken = grid_mesh(2, 1.0, flat_height);
  broken.indices.push_back(0);
  broken.indices.push_back(1);
  broken.indices.push_back(99);
  world::compute_smoothed_normals(broken, cfg);
  assert_unit_normals(broken);

  // Empty mesh is a no-op
  world::ChunkMesh empty;
  stats = world::compute_smoothed_normals(empty, cfg);
  assert(stats.flagged == 0 && stats.degenerate == 0);

  std::cout << "  Degenerate: PASS" << std::endl;
}

void test_peak_smoothing() {
  std::cout << "Testing peak normal smoothing..." << std::endl;

  // Steep ramp high above the threshold: every vertex is flagged
  world::ChunkMesh raw = grid_mesh(3, 10.0, ramp_height);
  world::ChunkMesh smoothed = raw;

  world::NormalSmoothingConfig off;
  off.peak_height_threshold = 1e9;
  world::NormalSmoothingStats off_stats = world::compute_smoothed_normals(raw, off);
  assert(off_stats.flagged == 0);

  world::NormalSmoothingConfig on;
  world::NormalSmoothingStats on_stats = world::compute_smoothed_normals(smoothed, on);
  assert(on_stats.flagged == smoothed.vertex_count());

  for (size_t k = 0; k < raw.vertex_count(); ++k) {
    assert(raw.vertices[k].normal.y < on.min_up_component);
    assert(smoothed.vertices[k].normal.y > raw.vertices[k].normal.y);
  }
  assert_unit_normals(smoothed);

  // Blend factor grows with height but is capped
  double low_gain = smoothed.at(0, 1).normal.y - raw.at(0, 1).normal.y;
  double high_gain = smoothed.at(2, 1).normal.y - raw.at(2, 1).normal.y;
  assert(high_gain > low_gain);

  // Gentle terrain is left alone
  world::ChunkMesh gentle = grid_mesh(3, 10.0, flat_height);
  world::NormalSmoothingStats gentle_stats = world::compute_smoothed_normals(gentle, on);
  assert(gentle_stats.flagged == 0);
  for (const auto &v : gentle.vertices) {
    assert(std::abs(v.normal.y - 1.0) < 1e-12);
  }

  std::cout << "  Peak smoothing: PASS" << std::endl;
}

void test_chunk_streaming() {
  std::cout << "Testing chunk streaming..." << std::endl;

  terrain::TerrainSystem terrain(seeded(42));
  world::ChunkMeshConfig mesh_cfg;
  mesh_cfg.chunk_size = 64.0;
  mesh_cfg.terrain_resolution = 6;
  world::ChunkMeshBuilder builder(terrain, mesh_cfg);

  world::ChunkManagerConfig cfg;
  cfg.view_distance = 2;
  cfg.max_builds_per_update = 1;
  world::ChunkManager manager(builder, cfg);

  int loaded_events = 0;
  int unloaded_events = 0;
  manager.on_chunk_loaded([&loaded_events](const world::ChunkMesh &) { ++loaded_events; });
  manager.on_chunk_unloaded([&unloaded_events](world::ChunkCoord) { ++unloaded_events; });

  // Circle of radius 2 holds 13 chunks; one build per update, nearest first
  manager.update(10.0, 10.0);
  assert(manager.loaded_count() == 1);
  assert(manager.get_chunk({0, 0}) != nullptr);
  assert(manager.pending_count() == 12);

  int guard = 0;
  while (manager.pending_count() > 0 && guard++ < 100) {
    manager.update(10.0, 10.0);
  }
  assert(manager.loaded_count() == 13);
  assert(loaded_events == 13);
  assert(manager.get_chunk({2, 0}) != nullptr);
  assert(manager.get_chunk({2, 1}) == nullptr);  // 4 + 1 > 2^2
  assert(manager.build_stats().builds == 13);

  for (const world::ChunkMesh *chunk : manager.get_loaded_chunks()) {
    int dx = chunk->coord.x;
    int dz = chunk->coord.z;
    assert(dx * dx + dz * dz <= 4);
  }

  // Fly far away: everything behind is released
  manager.update(64.0 * 10 + 1.0, 1.0);
  assert(unloaded_events == 13);
  assert(manager.loaded_count() == 1);
  assert(manager.get_chunk({10, 0}) != nullptr);
  assert(manager.get_chunk({0, 0}) == nullptr);
  assert(manager.player_chunk().x == 10);

  manager.clear();
  assert(manager.loaded_count() == 0);
  assert(manager.pending_count() == 0);
  assert(unloaded_events == 14);

  std::cout << "  Streaming: PASS" << std::endl;
}

void test_chunk_capacity() {
  std::cout << "Testing chunk capacity..." << std::endl;

  terrain::TerrainSystem terrain(seeded(42));
  world::ChunkMeshConfig mesh_cfg;
  mesh_cfg.chunk_size = 32.0;
  mesh_cfg.terrain_resolution = 4;
  world::ChunkMeshBuilder builder(terrain, mesh_cfg);

  world::ChunkManagerConfig cfg;
  cfg.view_distance = 3;
  cfg.max_builds_per_update = 4;
  cfg.max_loaded = 5;
  world::ChunkManager manager(builder, cfg);

  manager.update(0.0, 0.0);
  assert(manager.loaded_count() == 4);
  manager.update(0.0, 0.0);
  manager.update(0.0, 0.0);
  assert(manager.loaded_count() == 5);
  assert(manager.pending_count() == 0);

  // The nearest five: the centre and its four direct neighbours
  for (const world::ChunkMesh *chunk : manager.get_loaded_chunks()) {
    int d2 = chunk->coord.x * chunk->coord.x + chunk->coord.z * chunk->coord.z;
    assert(d2 <= 1);
  }

  // Negative coordinates floor toward -inf
  world::ChunkCoord c = manager.world_to_chunk(-0.1, 31.9);
  assert(c.x == -1 && c.z == 0);
  c = manager.world_to_chunk(std::nan(""), 1e300);
  assert(c.x == 0 && c.z == 0);

  std::cout << "  Capacity: PASS" << std::endl;
}

int main() {
  std::cout << "=== Running World Tests ===" << std::endl;

  test_mesh_layout();
  test_flatten_buffers();
  test_resolution_clamp();
  test_chunk_seams();
  test_normals_on_terrain();
  test_degenerate_normals();
  test_peak_smoothing();
  test_chunk_streaming();
  test_chunk_capacity();

  std::cout << std::endl;
  std::cout << "All tests PASSED!" << std::endl;
  return 0;
}
