/**
 * @file chunk_manager.cpp
 * @brief ChunkManager implementation for terrain streaming.
 */

#include <skycarpet/world/chunk_manager.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <unordered_set>

namespace skycarpet {
namespace world {

ChunkManager::ChunkManager(ChunkMeshBuilder& builder, const ChunkManagerConfig& config)
    : builder_(builder), config_(config) {
    config_.view_distance = std::max(0, config_.view_distance);
    config_.max_builds_per_update = std::max(1, config_.max_builds_per_update);
    config_.max_loaded = std::max<size_t>(1, config_.max_loaded);
}

ChunkCoord ChunkManager::world_to_chunk(double world_x, double world_z) const {
    double size = builder_.chunk_size();
    double cx = std::floor(world_x / size);
    double cz = std::floor(world_z / size);
    // Out-of-range positions pin to the origin chunk
    auto to_int = [](double c) {
        if (!std::isfinite(c) || std::abs(c) > 1e9) return 0;
        return static_cast<int>(c);
    };
    return {to_int(cx), to_int(cz)};
}

std::vector<ChunkCoord> ChunkManager::visible_set(ChunkCoord center) const {
    const int r = config_.view_distance;
    std::vector<ChunkCoord> result;
    for (int dz = -r; dz <= r; ++dz) {
        for (int dx = -r; dx <= r; ++dx) {
            if (dx * dx + dz * dz <= r * r) {
                result.push_back({center.x + dx, center.z + dz});
            }
        }
    }

    auto dist2 = [center](const ChunkCoord& c) {
        long long dx = c.x - center.x;
        long long dz = c.z - center.z;
        return dx * dx + dz * dz;
    };
    std::stable_sort(result.begin(), result.end(),
                     [&dist2](const ChunkCoord& a, const ChunkCoord& b) {
                         return dist2(a) < dist2(b);
                     });

    if (result.size() > config_.max_loaded) {
        result.resize(config_.max_loaded);
    }
    return result;
}

void ChunkManager::update(double world_x, double world_z) {
    player_chunk_ = world_to_chunk(world_x, world_z);
    std::vector<ChunkCoord> wanted = visible_set(player_chunk_);
    std::unordered_set<ChunkCoord, ChunkCoordHash> wanted_set(wanted.begin(), wanted.end());

    // Unload chunks that left the view
    std::vector<ChunkCoord> to_unload;
    for (const auto& entry : loaded_chunks_) {
        if (wanted_set.find(entry.first) == wanted_set.end()) {
            to_unload.push_back(entry.first);
        }
    }
    for (const auto& coord : to_unload) {
        unload_chunk(coord);
    }

    // Queue missing chunks, nearest first
    pending_.clear();
    for (const auto& coord : wanted) {
        if (loaded_chunks_.find(coord) == loaded_chunks_.end()) {
            pending_.push_back(coord);
        }
    }

    int budget = config_.max_builds_per_update;
    size_t built = 0;
    while (budget > 0 && built < pending_.size()) {
        load_chunk(pending_[built]);
        ++built;
        --budget;
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(built));
}

void ChunkManager::load_chunk(ChunkCoord coord) {
    auto start = std::chrono::steady_clock::now();
    auto mesh = std::make_unique<ChunkMesh>(builder_.build_chunk(coord.x, coord.z));
    auto end = std::chrono::steady_clock::now();

    double ms = std::chrono::duration<double, std::milli>(end - start).count();
    stats_.last_build_ms = ms;
    stats_.avg_build_ms = (stats_.avg_build_ms * stats_.builds + ms) / (stats_.builds + 1);
    ++stats_.builds;

    const ChunkMesh& ref = *mesh;
    loaded_chunks_[coord] = std::move(mesh);
    if (on_loaded_) on_loaded_(ref);
}

void ChunkManager::unload_chunk(ChunkCoord coord) {
    auto it = loaded_chunks_.find(coord);
    if (it == loaded_chunks_.end()) return;
    loaded_chunks_.erase(it);
    if (on_unloaded_) on_unloaded_(coord);
}

void ChunkManager::clear() {
    std::vector<ChunkCoord> coords;
    coords.reserve(loaded_chunks_.size());
    for (const auto& entry : loaded_chunks_) coords.push_back(entry.first);
    for (const auto& coord : coords) unload_chunk(coord);
    pending_.clear();
}

const ChunkMesh* ChunkManager::get_chunk(ChunkCoord coord) const {
    auto it = loaded_chunks_.find(coord);
    return it != loaded_chunks_.end() ? it->second.get() : nullptr;
}

std::vector<const ChunkMesh*> ChunkManager::get_loaded_chunks() const {
    std::vector<const ChunkMesh*> result;
    result.reserve(loaded_chunks_.size());
    for (const auto& entry : loaded_chunks_) {
        result.push_back(entry.second.get());
    }
    return result;
}

} // namespace world
} // namespace skycarpet
