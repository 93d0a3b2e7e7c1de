/**
 * @file height_cache.cpp
 * @brief HeightCache implementation.
 */

#include <skycarpet/core/constants.hpp>
#include <skycarpet/terrain/height_cache.hpp>

#include <algorithm>
#include <cmath>

namespace skycarpet {
namespace terrain {

HeightCache::HeightCache(const HeightField& field, const HeightCacheConfig& config)
    : field_(field), config_(config) {}

double HeightCache::quantize(double v) const {
    if (config_.resolution <= 0.0) return v;
    return std::floor(v / config_.resolution) * config_.resolution;
}

double HeightCache::get_cached_height(double x, double z) {
    if (!enabled()) {
        ++misses_;
        return field_.get_terrain_height(x, z);
    }

    double cx = std::floor(x / config_.resolution);
    double cz = std::floor(z / config_.resolution);
    if (!std::isfinite(cx) || !std::isfinite(cz) ||
        std::abs(cx) > constants::MAX_SAFE_CELL ||
        std::abs(cz) > constants::MAX_SAFE_CELL) {
        ++misses_;
        return field_.get_terrain_height(x, z);
    }

    GridKey key{static_cast<int64_t>(cx), static_cast<int64_t>(cz)};
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        ++hits_;
        return it->second;
    }

    ++misses_;
    double h = field_.get_terrain_height(cx * config_.resolution, cz * config_.resolution);

    if (cache_.size() >= config_.max_cache_size) {
        evict_oldest();
    }
    cache_.emplace(key, h);
    insertion_order_.push_back(key);
    return h;
}

void HeightCache::evict_oldest() {
    size_t count = std::max<size_t>(1, config_.max_cache_size / 10);
    while (count > 0 && !insertion_order_.empty()) {
        cache_.erase(insertion_order_.front());
        insertion_order_.pop_front();
        --count;
    }
}

void HeightCache::clear_cache() {
    cache_.clear();
    insertion_order_.clear();
    hits_ = 0;
    misses_ = 0;
}

CacheStats HeightCache::get_cache_stats() const {
    CacheStats stats;
    stats.size = cache_.size();
    stats.hits = hits_;
    stats.misses = misses_;
    uint64_t total = hits_ + misses_;
    stats.hit_rate = total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
    return stats;
}

} // namespace terrain
} // namespace skycarpet
