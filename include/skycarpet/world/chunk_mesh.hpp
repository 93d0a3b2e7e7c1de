#pragma once

/**
 * @file chunk_mesh.hpp
 * @brief Chunk coordinates and the renderable mesh of one terrain chunk.
 */

#include <skycarpet/core/math.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace skycarpet {
namespace world {

/**
 * @brief Chunk coordinates on the horizontal plane.
 */
struct ChunkCoord {
    int x = 0;
    int z = 0;

    bool operator==(const ChunkCoord& other) const {
        return x == other.x && z == other.z;
    }
    bool operator!=(const ChunkCoord& other) const { return !(*this == other); }
};

/**
 * @brief Hash function for ChunkCoord.
 */
struct ChunkCoordHash {
    size_t operator()(const ChunkCoord& c) const {
        return static_cast<size_t>(static_cast<uint32_t>(c.x)) ^
               (static_cast<size_t>(static_cast<uint32_t>(c.z)) << 16) ^
               (static_cast<size_t>(static_cast<uint32_t>(c.z)) >> 16);
    }
};

struct Vertex {
    core::Vec3 position;   // Chunk-local x/z, world height in y
    core::Vec3 normal;
    core::Rgb color;
};

/**
 * @brief Grid mesh of one chunk.
 *
 * Vertices are row-major with x fastest: index = j * resolution + i.
 * Triangles are counter-clockwise seen from +y.
 */
struct ChunkMesh {
    ChunkCoord coord;
    int resolution = 0;
    double chunk_size = 0.0;
    double origin_x = 0.0;   // World position of vertex (0, 0)
    double origin_z = 0.0;

    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;

    size_t vertex_count() const { return vertices.size(); }
    size_t triangle_count() const { return indices.size() / 3; }

    const Vertex& at(int i, int j) const { return vertices[static_cast<size_t>(j) * resolution + i]; }

    // Renderer hand-off: three floats per vertex
    std::vector<float> flatten_positions() const;
    std::vector<float> flatten_normals() const;
    std::vector<float> flatten_colors() const;
};

} // namespace world
} // namespace skycarpet
