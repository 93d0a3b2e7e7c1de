#pragma once

/**
 * @file constants.hpp
 * @brief World-scale constants and numeric fallbacks for SkyCarpet.
 */

namespace skycarpet {
namespace constants {

// === World ===
constexpr double SEA_LEVEL = 0.0;              // World Y of the water plane
constexpr double FALLBACK_HEIGHT = 0.0;        // Returned for degenerate samples

// === Noise ===
constexpr int MAX_OCTAVES = 16;
constexpr double NOISE_WRAP = 256.0;           // Permutation period (lattice cells)
constexpr double MAX_SAFE_CELL = 9007199254740992.0;  // 2^53

// === Geometry ===
constexpr int MIN_CHUNK_RESOLUTION = 2;
constexpr int MAX_CHUNK_RESOLUTION = 256;

// === Gameplay ===
constexpr double MIN_HOVER_CLEARANCE = 2.0;    // Carpet never sits below this
constexpr double MANA_HOVER_HEIGHT = 10.0;     // Mana nodes float above ground/water

}  // namespace constants
}  // namespace skycarpet
