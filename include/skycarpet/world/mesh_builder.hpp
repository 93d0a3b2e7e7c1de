#pragma once

/**
 * @file mesh_builder.hpp
 * @brief Builds chunk meshes from the terrain service.
 */

#include <skycarpet/terrain/terrain_system.hpp>
#include <skycarpet/world/chunk_mesh.hpp>
#include <skycarpet/world/normal_smoothing.hpp>

namespace skycarpet {
namespace world {

struct ChunkMeshConfig {
    double chunk_size = 256.0;    // World units per chunk edge, (0, 1e6]
    int terrain_resolution = 64;  // Vertices per edge, [2, 256]
};

/**
 * @brief Samples the terrain on a regular grid per chunk.
 *
 * Vertex (i, j) of chunk (cx, cz) sits at world
 *   ((cx * (res - 1) + i) * step, (cz * (res - 1) + j) * step),
 * so the shared edge of two neighbouring chunks samples bit-identical
 * coordinates and therefore identical heights and colours.
 */
class ChunkMeshBuilder {
public:
    ChunkMeshBuilder(terrain::TerrainSystem& terrain, const ChunkMeshConfig& config,
                     const NormalSmoothingConfig& smoothing = NormalSmoothingConfig{});

    ChunkMesh build_chunk(int chunk_x, int chunk_z);

    int resolution() const { return resolution_; }
    double chunk_size() const { return chunk_size_; }
    double step() const { return chunk_size_ / (resolution_ - 1); }

    /**
     * @brief World coordinate of lattice index i along one axis of chunk c.
     */
    double lattice_to_world(int chunk, int i) const;

    const NormalSmoothingStats& last_smoothing_stats() const { return last_stats_; }

private:
    terrain::TerrainSystem& terrain_;
    NormalSmoothingConfig smoothing_;
    int resolution_;
    double chunk_size_;
    NormalSmoothingStats last_stats_;
};

} // namespace world
} // namespace skycarpet
