/**
 * @file mesh_builder.cpp
 * @brief Chunk grid sampling, colouring and triangulation.
 */

#include <skycarpet/core/constants.hpp>
#include <skycarpet/world/mesh_builder.hpp>

#include <algorithm>
#include <cmath>

namespace skycarpet {
namespace world {

ChunkMeshBuilder::ChunkMeshBuilder(terrain::TerrainSystem& terrain,
                                   const ChunkMeshConfig& config,
                                   const NormalSmoothingConfig& smoothing)
    : terrain_(terrain), smoothing_(smoothing) {
    resolution_ = std::clamp(config.terrain_resolution, constants::MIN_CHUNK_RESOLUTION,
                             constants::MAX_CHUNK_RESOLUTION);
    chunk_size_ = (std::isfinite(config.chunk_size) && config.chunk_size > 0.0)
                      ? config.chunk_size
                      : ChunkMeshConfig{}.chunk_size;
}

double ChunkMeshBuilder::lattice_to_world(int chunk, int i) const {
    int64_t index = static_cast<int64_t>(chunk) * (resolution_ - 1) + i;
    return static_cast<double>(index) * step();
}

ChunkMesh ChunkMeshBuilder::build_chunk(int chunk_x, int chunk_z) {
    const int res = resolution_;
    const double step = this->step();

    ChunkMesh mesh;
    mesh.coord = {chunk_x, chunk_z};
    mesh.resolution = res;
    mesh.chunk_size = chunk_size_;
    mesh.origin_x = lattice_to_world(chunk_x, 0);
    mesh.origin_z = lattice_to_world(chunk_z, 0);
    mesh.vertices.resize(static_cast<size_t>(res) * res);

    // Heights and slopes go through the cache, which is single-threaded
    std::vector<double> slopes(mesh.vertices.size());
    for (int j = 0; j < res; ++j) {
        double wz = lattice_to_world(chunk_z, j);
        for (int i = 0; i < res; ++i) {
            double wx = lattice_to_world(chunk_x, i);
            size_t idx = static_cast<size_t>(j) * res + i;

            Vertex& v = mesh.vertices[idx];
            v.position = {i * step, terrain_.get_cached_height(wx, wz), j * step};
            slopes[idx] = terrain_.get_slope(wx, wz);
        }
    }

    // Colours are pure; classify in parallel
    const int count = static_cast<int>(mesh.vertices.size());
    const terrain::TerrainSystem& terrain = terrain_;
    #pragma omp parallel for schedule(dynamic, 16)
    for (int idx = 0; idx < count; ++idx) {
        int i = idx % res;
        int j = idx / res;
        Vertex& v = mesh.vertices[idx];
        v.color = terrain.get_biome_color(lattice_to_world(chunk_x, i),
                                          lattice_to_world(chunk_z, j),
                                          v.position.y, slopes[idx]);
    }

    mesh.indices.reserve(static_cast<size_t>(res - 1) * (res - 1) * 6);
    for (int j = 0; j < res - 1; ++j) {
        for (int i = 0; i < res - 1; ++i) {
            uint32_t a = static_cast<uint32_t>(j * res + i);
            uint32_t b = a + 1;
            uint32_t c = a + static_cast<uint32_t>(res);
            uint32_t d = c + 1;

            mesh.indices.push_back(a);
            mesh.indices.push_back(c);
            mesh.indices.push_back(b);

            mesh.indices.push_back(b);
            mesh.indices.push_back(c);
            mesh.indices.push_back(d);
        }
    }

    last_stats_ = compute_smoothed_normals(mesh, smoothing_);
    return mesh;
}

} // namespace world
} // namespace skycarpet
