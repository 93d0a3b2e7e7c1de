#pragma once

/**
 * @file config.hpp
 * @brief Aggregate world configuration and its key=value file format.
 *
 * Every tunable threshold of the pipeline is a named field here. Files use
 * one `key=value` per line, `#` starts a comment:
 *
 *   height.seed=42
 *   height.transition_start=0.10
 *   chunks.view_distance=3
 */

#include <skycarpet/core/constants.hpp>
#include <skycarpet/terrain/terrain_system.hpp>
#include <skycarpet/world/chunk_manager.hpp>
#include <skycarpet/world/mesh_builder.hpp>
#include <skycarpet/world/normal_smoothing.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace skycarpet {
namespace core {

/**
 * @brief Carpet flight and mana placement parameters.
 */
struct FlightConfig {
    double cruise_speed = 40.0;     // World units per second
    double boost_speed = 90.0;
    double turn_rate = 1.6;         // Radians per second
    double climb_rate = 25.0;       // World units per second
    double min_clearance = constants::MIN_HOVER_CLEARANCE;  // Above terrain, >= 0
    double spawn_height = 30.0;     // Above terrain at spawn
    int mana_count = 24;            // [0, 4096]
    double mana_radius = 600.0;     // Placement radius around spawn
    double collect_radius = 6.0;    // Pickup distance
    uint32_t mana_seed = 7;
};

struct WorldConfig {
    terrain::TerrainSettings terrain;
    world::ChunkMeshConfig mesh;
    world::NormalSmoothingConfig smoothing;
    world::ChunkManagerConfig chunks;
    FlightConfig flight;
};

/**
 * @brief Clamp every field into its documented range.
 * @return One message per corrected field; empty when the config was valid.
 */
std::vector<std::string> sanitize(WorldConfig& config);

/**
 * @brief Load a config file over the current values.
 *
 * A missing file is created with the current values. Malformed lines and
 * unknown keys are reported and skipped.
 * @return false if the file could neither be read nor created.
 */
bool load_config_file(const std::string& path, WorldConfig& config);

/**
 * @brief Write every key of the config.
 */
bool save_config_file(const std::string& path, const WorldConfig& config);

}  // namespace core
}  // namespace skycarpet
