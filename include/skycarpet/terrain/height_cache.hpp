#pragma once

/**
 * @file height_cache.hpp
 * @brief Quantized memoization of terrain heights with bounded size.
 */

#include <skycarpet/terrain/height_field.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <unordered_map>

namespace skycarpet {
namespace terrain {

struct HeightCacheConfig {
    double resolution = 1.0;        // Cell size in world units; <= 0 disables caching
    size_t max_cache_size = 65536;  // Entry bound; 0 disables caching
};

struct CacheStats {
    size_t size = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hit_rate = 0.0;          // hits / (hits + misses), 0 when no lookups
};

/**
 * @brief Integer cell coordinate used as the cache key.
 */
struct GridKey {
    int64_t x = 0;
    int64_t z = 0;

    bool operator==(const GridKey& o) const { return x == o.x && z == o.z; }
};

struct GridKeyHash {
    size_t operator()(const GridKey& k) const {
        uint64_t hx = static_cast<uint64_t>(k.x) * 73856093ULL;
        uint64_t hz = static_cast<uint64_t>(k.z) * 19349663ULL;
        return std::hash<uint64_t>()(hx ^ hz);
    }
};

/**
 * @brief Memoizes HeightField samples on a regular grid.
 *
 * Every query inside one cell returns the height at the cell origin
 * (floor(x/R)*R, floor(z/R)*R), whether it was served from the map or
 * computed on a miss. When full, the oldest tenth of the entries is evicted
 * by insertion order.
 *
 * Not thread-safe: intended for the main simulation thread only.
 */
class HeightCache {
public:
    HeightCache(const HeightField& field, const HeightCacheConfig& config);

    double get_cached_height(double x, double z);

    void clear_cache();

    CacheStats get_cache_stats() const;

    size_t size() const { return cache_.size(); }

    /**
     * @brief Cell origin for a coordinate: floor(v / R) * R (v when disabled).
     */
    double quantize(double v) const;

    bool enabled() const {
        return config_.resolution > 0.0 && config_.max_cache_size > 0;
    }

    const HeightCacheConfig& config() const { return config_; }

private:
    const HeightField& field_;
    HeightCacheConfig config_;

    std::unordered_map<GridKey, double, GridKeyHash> cache_;
    std::deque<GridKey> insertion_order_;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;

    void evict_oldest();
};

} // namespace terrain
} // namespace skycarpet
