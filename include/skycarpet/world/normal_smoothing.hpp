#pragma once

/**
 * @file normal_smoothing.hpp
 * @brief Vertex normal computation with peak smoothing.
 */

#include <skycarpet/world/chunk_mesh.hpp>

#include <cstddef>

namespace skycarpet {
namespace world {

/**
 * @brief Tuning for the peak smoothing pass.
 *
 * Vertices above peak_height_threshold whose normal is steeper than
 * min_up_component are pulled toward their neighbours' average normal and
 * then toward straight up, by
 *   f = min(max_blend, blend_base + (y - peak_height_threshold) * blend_per_unit).
 */
struct NormalSmoothingConfig {
    double peak_height_threshold = 120.0;  // World height
    double min_up_component = 0.35;        // [0, 1]
    double blend_base = 0.15;              // [0, 1]
    double blend_per_unit = 0.004;         // [0, 1]
    double max_blend = 0.5;                // [0, 1]
    double up_blend_share = 0.5;           // [0, 1], fraction of f applied toward up
    double degenerate_epsilon = 1e-6;      // (0, 1e-2]
};

struct NormalSmoothingStats {
    size_t flagged = 0;      // Vertices that received peak smoothing
    size_t degenerate = 0;   // Vertices that fell back to the up vector
};

/**
 * @brief Recompute every vertex normal of a mesh in place.
 *
 * Output normals are unit length and finite; degenerate ones become (0, 1, 0).
 */
NormalSmoothingStats compute_smoothed_normals(ChunkMesh& mesh,
                                              const NormalSmoothingConfig& config);

} // namespace world
} // namespace skycarpet
