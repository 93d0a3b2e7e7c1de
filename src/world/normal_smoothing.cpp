/**
 * @file normal_smoothing.cpp
 * @brief Face-normal accumulation and peak smoothing.
 */

#include <skycarpet/core/math.hpp>
#include <skycarpet/world/normal_smoothing.hpp>

#include <algorithm>
#include <vector>

namespace skycarpet {
namespace world {

using core::Vec3;

namespace {

const Vec3 UP{0.0, 1.0, 0.0};

std::vector<std::vector<uint32_t>> build_adjacency(const ChunkMesh& mesh) {
    std::vector<std::vector<uint32_t>> adjacency(mesh.vertices.size());
    auto link = [&adjacency](uint32_t a, uint32_t b) {
        auto& list = adjacency[a];
        if (std::find(list.begin(), list.end(), b) == list.end()) list.push_back(b);
    };
    const size_t n = mesh.vertices.size();
    for (size_t t = 0; t + 2 < mesh.indices.size(); t += 3) {
        uint32_t a = mesh.indices[t], b = mesh.indices[t + 1], c = mesh.indices[t + 2];
        if (a >= n || b >= n || c >= n) continue;
        link(a, b); link(a, c);
        link(b, a); link(b, c);
        link(c, a); link(c, b);
    }
    return adjacency;
}

} // namespace

NormalSmoothingStats compute_smoothed_normals(ChunkMesh& mesh,
                                              const NormalSmoothingConfig& config) {
    NormalSmoothingStats stats;
    auto& verts = mesh.vertices;
    const size_t n = verts.size();
    const double eps = config.degenerate_epsilon;

    // 1. Accumulate area-weighted face normals
    std::vector<Vec3> accum(n);
    for (size_t t = 0; t + 2 < mesh.indices.size(); t += 3) {
        uint32_t a = mesh.indices[t], b = mesh.indices[t + 1], c = mesh.indices[t + 2];
        if (a >= n || b >= n || c >= n) continue;

        const Vec3& p0 = verts[a].position;
        Vec3 face = (verts[b].position - p0).cross(verts[c].position - p0);
        if (!face.is_finite()) continue;

        accum[a] += face;
        accum[b] += face;
        accum[c] += face;
    }

    // 2. Normalize with fallback
    for (size_t i = 0; i < n; ++i) {
        bool degenerate = !accum[i].is_finite() || !(accum[i].length() > eps);
        if (degenerate) ++stats.degenerate;
        verts[i].normal = degenerate ? UP : core::normalize_or(accum[i], UP, eps);
    }

    // 3. Flag steep vertices near peaks
    std::vector<uint32_t> flagged;
    for (size_t i = 0; i < n; ++i) {
        if (verts[i].position.y > config.peak_height_threshold &&
            verts[i].normal.y < config.min_up_component) {
            flagged.push_back(static_cast<uint32_t>(i));
        }
    }
    stats.flagged = flagged.size();
    if (flagged.empty()) return stats;

    // 4. Blend flagged vertices toward neighbour average, then toward up
    auto adjacency = build_adjacency(mesh);
    std::vector<Vec3> snapshot(n);
    for (size_t i = 0; i < n; ++i) snapshot[i] = verts[i].normal;

    for (uint32_t i : flagged) {
        Vec3 avg;
        for (uint32_t nb : adjacency[i]) avg += snapshot[nb];
        avg = core::normalize_or(avg, snapshot[i], eps);

        double f = config.blend_base +
                   (verts[i].position.y - config.peak_height_threshold) * config.blend_per_unit;
        f = std::clamp(std::min(f, config.max_blend), 0.0, 1.0);

        Vec3 blended = core::normalize_or(snapshot[i] * (1.0 - f) + avg * f, UP, eps);
        double up_f = std::clamp(f * config.up_blend_share, 0.0, 1.0);
        blended = blended * (1.0 - up_f) + UP * up_f;

        // 5. Final normalization
        verts[i].normal = core::normalize_or(blended, UP, eps);
    }

    return stats;
}

} // namespace world
} // namespace skycarpet
