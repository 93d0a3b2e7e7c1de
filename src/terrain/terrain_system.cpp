/**
 * @file terrain_system.cpp
 * @brief TerrainSystem implementation.
 */

#include <skycarpet/core/math.hpp>
#include <skycarpet/terrain/terrain_system.hpp>

#include <cmath>

namespace skycarpet {
namespace terrain {

TerrainSystem::TerrainSystem(const TerrainSettings& settings)
    : settings_(settings),
      noise_(settings.height.seed),
      field_(noise_, settings.height),
      cache_(field_, settings.cache),
      classifier_(noise_, settings.biome) {}

double TerrainSystem::get_slope(double x, double z) {
    double d = settings_.slope_sample_distance;
    if (!(d > 0.0)) d = 2.0;

    double dx = get_cached_height(x + d, z) - get_cached_height(x - d, z);
    double dz = get_cached_height(x, z + d) - get_cached_height(x, z - d);
    double slope = std::sqrt(dx * dx + dz * dz) / (2.0 * d);
    return core::finite_or(slope, 0.0);
}

void TerrainSystem::regenerate(uint32_t seed) {
    // In-place reassignment keeps the field and classifier references valid
    noise_ = NoiseGenerator(seed);
    settings_.height.seed = seed;
    cache_.clear_cache();
}

} // namespace terrain
} // namespace skycarpet
