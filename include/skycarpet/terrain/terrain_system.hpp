#pragma once

/**
 * @file terrain_system.hpp
 * @brief Terrain query service for the mesh builder and gameplay code.
 */

#include <skycarpet/terrain/biome_classifier.hpp>
#include <skycarpet/terrain/height_cache.hpp>
#include <skycarpet/terrain/height_field.hpp>
#include <skycarpet/terrain/noise.hpp>

namespace skycarpet {
namespace terrain {

/**
 * @brief Everything needed to build a TerrainSystem.
 */
struct TerrainSettings {
    HeightFieldConfig height;
    HeightCacheConfig cache;
    BiomeConfig biome;
    double slope_sample_distance = 2.0;  // (0, 64], finite-difference offset
};

/**
 * @brief Owns the noise, height field, height cache and biome classifier.
 *
 * Height and colour queries are pure. The cache is the only mutable state;
 * cached queries must stay on one thread.
 */
class TerrainSystem {
public:
    explicit TerrainSystem(const TerrainSettings& settings);

    TerrainSystem(const TerrainSystem&) = delete;
    TerrainSystem& operator=(const TerrainSystem&) = delete;

    double get_terrain_height(double x, double z) const {
        return field_.get_terrain_height(x, z);
    }

    double get_cached_height(double x, double z) { return cache_.get_cached_height(x, z); }

    /**
     * @brief Gradient magnitude from central differences of cached heights.
     */
    double get_slope(double x, double z);

    core::Rgb get_biome_color(double x, double z, double height, double slope) const {
        return classifier_.get_biome_color(x, z, height, slope);
    }

    /**
     * @brief Re-seed the world. The height cache is always cleared.
     */
    void regenerate(uint32_t seed);

    void clear_cache() { cache_.clear_cache(); }
    CacheStats get_cache_stats() const { return cache_.get_cache_stats(); }

    uint32_t seed() const { return noise_.seed(); }
    double continent_mask(double x, double z) const { return field_.continent_mask(x, z); }

    const TerrainSettings& settings() const { return settings_; }
    const HeightCache& height_cache() const { return cache_; }
    const BiomeClassifier& classifier() const { return classifier_; }

private:
    TerrainSettings settings_;
    NoiseGenerator noise_;
    HeightField field_;
    HeightCache cache_;
    BiomeClassifier classifier_;
};

} // namespace terrain
} // namespace skycarpet
