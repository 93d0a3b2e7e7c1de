/**
 * @file chunk_mesh.cpp
 * @brief Flattening of structured vertices into renderer buffers.
 */

#include <skycarpet/world/chunk_mesh.hpp>

namespace skycarpet {
namespace world {

std::vector<float> ChunkMesh::flatten_positions() const {
    std::vector<float> out;
    out.reserve(vertices.size() * 3);
    for (const auto& v : vertices) {
        out.push_back(static_cast<float>(v.position.x));
        out.push_back(static_cast<float>(v.position.y));
        out.push_back(static_cast<float>(v.position.z));
    }
    return out;
}

std::vector<float> ChunkMesh::flatten_normals() const {
    std::vector<float> out;
    out.reserve(vertices.size() * 3);
    for (const auto& v : vertices) {
        out.push_back(static_cast<float>(v.normal.x));
        out.push_back(static_cast<float>(v.normal.y));
        out.push_back(static_cast<float>(v.normal.z));
    }
    return out;
}

std::vector<float> ChunkMesh::flatten_colors() const {
    std::vector<float> out;
    out.reserve(vertices.size() * 3);
    for (const auto& v : vertices) {
        out.push_back(static_cast<float>(v.color.r));
        out.push_back(static_cast<float>(v.color.g));
        out.push_back(static_cast<float>(v.color.b));
    }
    return out;
}

} // namespace world
} // namespace skycarpet
