#pragma once

/**
 * @file chunk_manager.hpp
 * @brief Streams chunk meshes in and out around the player.
 */

#include <skycarpet/world/chunk_mesh.hpp>
#include <skycarpet/world/mesh_builder.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace skycarpet {
namespace world {

/**
 * @brief Configuration for ChunkManager.
 */
struct ChunkManagerConfig {
    int view_distance = 3;          // Circular radius in chunks, [0, 32]
    int max_builds_per_update = 1;  // Chunk builds per update() call, [1, 64]
    size_t max_loaded = 256;        // Hard cap; nearest chunks win
};

/**
 * @brief Build timing, in milliseconds.
 */
struct ChunkBuildStats {
    size_t builds = 0;
    double last_build_ms = 0.0;
    double avg_build_ms = 0.0;
};

/**
 * @brief Manages chunk lifecycle and streaming.
 *
 * Chunks within view_distance of the player chunk are kept; missing ones are
 * built nearest-first, at most max_builds_per_update per call, so the cost of
 * a frame stays bounded while the player moves.
 */
class ChunkManager {
public:
    using LoadCallback = std::function<void(const ChunkMesh&)>;
    using UnloadCallback = std::function<void(ChunkCoord)>;

    ChunkManager(ChunkMeshBuilder& builder, const ChunkManagerConfig& config);
    ~ChunkManager() = default;

    /**
     * @brief Update loaded chunks for the player's world position.
     */
    void update(double world_x, double world_z);

    /**
     * @brief Unload every chunk and forget pending builds.
     */
    void clear();

    /**
     * @return Pointer to the chunk, or nullptr if it is not loaded.
     */
    const ChunkMesh* get_chunk(ChunkCoord coord) const;

    std::vector<const ChunkMesh*> get_loaded_chunks() const;

    ChunkCoord world_to_chunk(double world_x, double world_z) const;

    void on_chunk_loaded(LoadCallback cb) { on_loaded_ = std::move(cb); }
    void on_chunk_unloaded(UnloadCallback cb) { on_unloaded_ = std::move(cb); }

    // Statistics
    size_t loaded_count() const { return loaded_chunks_.size(); }
    size_t pending_count() const { return pending_.size(); }
    const ChunkBuildStats& build_stats() const { return stats_; }
    ChunkCoord player_chunk() const { return player_chunk_; }
    const ChunkManagerConfig& config() const { return config_; }

private:
    ChunkMeshBuilder& builder_;
    ChunkManagerConfig config_;
    std::unordered_map<ChunkCoord, std::unique_ptr<ChunkMesh>, ChunkCoordHash> loaded_chunks_;
    std::vector<ChunkCoord> pending_;

    ChunkCoord player_chunk_{0, 0};
    ChunkBuildStats stats_;

    LoadCallback on_loaded_;
    UnloadCallback on_unloaded_;

    std::vector<ChunkCoord> visible_set(ChunkCoord center) const;
    void load_chunk(ChunkCoord coord);
    void unload_chunk(ChunkCoord coord);
};

} // namespace world
} // namespace skycarpet
