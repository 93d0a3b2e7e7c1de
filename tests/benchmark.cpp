/**
 * @file benchmark.cpp
 * @brief Benchmark suite for the terrain and chunk streaming pipeline.
 */

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <skycarpet/terrain/fractal_noise.hpp>
#include <skycarpet/terrain/noise.hpp>
#include <skycarpet/terrain/terrain_system.hpp>
#include <skycarpet/world/chunk_manager.hpp>
#include <skycarpet/world/mesh_builder.hpp>

using namespace skycarpet;
using Clock = std::chrono::high_resolution_clock;

struct BenchmarkResult {
  std::string name;
  double total_ms;
  double per_step_us;
  size_t iterations;
};

template <typename Func>
BenchmarkResult run_benchmark(const std::string &name, size_t iterations,
                              Func &&func) {
  auto start = Clock::now();
  for (size_t i = 0; i < iterations; ++i) {
    func();
  }
  auto end = Clock::now();

  double total_ms =
      std::chrono::duration<double, std::milli>(end - start).count();
  double per_step_us = (total_ms * 1000.0) / iterations;

  return {name, total_ms, per_step_us, iterations};
}

void print_result(const BenchmarkResult &r) {
  std::cout << std::left << std::setw(30) << r.name << std::right
            << std::setw(10) << std::fixed << std::setprecision(2) << r.total_ms
            << " ms  " << std::setw(10) << r.per_step_us << " µs/step  ("
            << r.iterations << " iters)\n";
}

int main() {
  std::cout
      << "╔══════════════════════════════════════════════════════════════╗\n";
  std::cout
      << "║        SKYCARPET TERRAIN - BENCHMARK SUITE                   ║\n";
  std::cout
      << "╚══════════════════════════════════════════════════════════════╝\n\n";

  std::vector<BenchmarkResult> results;
  const size_t SAMPLE_ITERS = 200000;
  const size_t CHUNK_ITERS = 20;

  // Sink keeps the optimizer from discarding sampled values
  volatile double sink = 0.0;

  // =========================================================================
  // SAMPLING BENCHMARKS
  // =========================================================================
  std::cout << "═══ SAMPLING ═══\n";

  {
    terrain::NoiseGenerator noise(42);
    double x = 0.0;
    results.push_back(run_benchmark("Noise2D", SAMPLE_ITERS, [&]() {
      sink = noise.noise2d(x, x * 0.5);
      x += 0.37;
    }));
    print_result(results.back());

    x = 0.0;
    results.push_back(run_benchmark("Fractal 4 octaves", SAMPLE_ITERS / 4, [&]() {
      sink = terrain::fractal_noise(noise, x, -x, 0.004, 4);
      x += 1.3;
    }));
    print_result(results.back());

    x = 0.0;
    results.push_back(run_benchmark("Ridged 4 octaves", SAMPLE_ITERS / 4, [&]() {
      sink = terrain::ridged_noise(noise, x, -x, 0.004, 4);
      x += 1.3;
    }));
    print_result(results.back());
  }

  {
    terrain::TerrainSettings settings;
    terrain::TerrainSystem terrain(settings);

    double x = 0.0;
    results.push_back(run_benchmark("Terrain height (uncached)", SAMPLE_ITERS / 10, [&]() {
      sink = terrain.get_terrain_height(x, x * 0.25);
      x += 3.1;
    }));
    print_result(results.back());

    // Revisit a small window so most lookups hit
    size_t n = 0;
    results.push_back(run_benchmark("Terrain height (cached)", SAMPLE_ITERS, [&]() {
      double px = static_cast<double>(n % 128);
      double pz = static_cast<double>((n / 128) % 128);
      sink = terrain.get_cached_height(px, pz);
      ++n;
    }));
    print_result(results.back());

    auto stats = terrain.get_cache_stats();
    std::cout << "  cache: " << stats.size << " cells, hit rate "
              << std::setprecision(1) << stats.hit_rate * 100.0 << "%\n";

    x = 0.0;
    results.push_back(run_benchmark("Biome color", SAMPLE_ITERS / 4, [&]() {
      sink = terrain.get_biome_color(x, -x, 40.0 + (static_cast<int>(x) % 200), 0.3).g;
      x += 2.7;
    }));
    print_result(results.back());
  }

  // =========================================================================
  // MESHING BENCHMARKS
  // =========================================================================
  std::cout << "\n═══ MESHING ═══\n";

  {
    terrain::TerrainSettings settings;
    terrain::TerrainSystem terrain(settings);
    world::ChunkMeshConfig mesh_cfg;
    mesh_cfg.terrain_resolution = 64;
    world::ChunkMeshBuilder builder(terrain, mesh_cfg);

    int cx = 0;
    results.push_back(run_benchmark("Chunk build 64x64", CHUNK_ITERS, [&]() {
      auto mesh = builder.build_chunk(cx++, 3);
      sink = static_cast<double>(mesh.vertex_count());
    }));
    print_result(results.back());

    // Same chunk again: heights come from the cache
    results.push_back(run_benchmark("Chunk rebuild (warm cache)", CHUNK_ITERS, [&]() {
      auto mesh = builder.build_chunk(0, 3);
      sink = static_cast<double>(mesh.triangle_count());
    }));
    print_result(results.back());
  }

  {
    terrain::TerrainSettings settings;
    terrain::TerrainSystem terrain(settings);
    world::ChunkMeshConfig mesh_cfg;
    mesh_cfg.terrain_resolution = 32;
    world::ChunkMeshBuilder builder(terrain, mesh_cfg);

    world::ChunkManagerConfig mgr_cfg;
    mgr_cfg.view_distance = 2;
    mgr_cfg.max_builds_per_update = 4;
    world::ChunkManager manager(builder, mgr_cfg);

    // Fly east, one update per frame
    double px = 0.0;
    results.push_back(run_benchmark("Chunk streaming sweep", 240, [&]() {
      manager.update(px, 0.0);
      px += 16.0;
    }));
    print_result(results.back());

    const auto &stats = manager.build_stats();
    std::cout << "  builds: " << stats.builds << ", avg "
              << std::setprecision(2) << stats.avg_build_ms << " ms, loaded "
              << manager.loaded_count() << "\n";
  }

  // =========================================================================
  // SUMMARY
  // =========================================================================
  std::cout
      << "\n╔══════════════════════════════════════════════════════════════╗\n";
  std::cout
      << "║                        SUMMARY                               ║\n";
  std::cout
      << "╚══════════════════════════════════════════════════════════════╝\n\n";

  double chunk_us = 0.0;
  for (const auto &r : results) {
    if (r.name == "Chunk build 64x64") {
      chunk_us = r.per_step_us;
    }
  }

  double target_fps = 60.0;
  double budget_us = 1000000.0 / target_fps;
  double usage_percent = chunk_us / budget_us * 100.0;

  std::cout << "Target frame budget (60 FPS): " << std::setprecision(0)
            << budget_us << " µs\n";
  std::cout << "Cold chunk build: " << std::setprecision(1) << usage_percent
            << "% of one frame\n";

  if (usage_percent < 50) {
    std::cout << "✓ One chunk build per frame fits the budget\n";
  } else {
    std::cout << "⚠ Chunk builds should be spread over several frames\n";
  }

  return 0;
}
