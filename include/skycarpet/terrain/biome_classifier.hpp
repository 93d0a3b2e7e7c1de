#pragma once

/**
 * @file biome_classifier.hpp
 * @brief Table-driven (height, slope, position) -> colour classification.
 */

#include <skycarpet/core/math.hpp>
#include <skycarpet/terrain/noise.hpp>

#include <string>
#include <vector>

namespace skycarpet {
namespace terrain {

/**
 * @brief One elevation band of the colour table.
 *
 * The band fades in over [start_height - blend_width/2,
 * start_height + blend_width/2]. Moisture picks a tone between dry_color
 * and lush_color.
 */
struct BiomeBand {
    std::string name;
    double start_height = 0.0;
    double blend_width = 4.0;
    core::Rgb dry_color;
    core::Rgb lush_color;
};

/**
 * @brief Default band table, ordered by start height.
 */
std::vector<BiomeBand> default_biome_bands();

struct BiomeConfig {
    std::vector<BiomeBand> bands = default_biome_bands();

    // Shared noise fields
    double moisture_frequency = 0.0004;   // (0, 0.1]
    double tone_frequency = 0.002;        // (0, 0.1], macro brightness variation
    double texture_frequency = 0.08;      // (0, 1], micro texture
    double tone_strength = 0.06;          // [0, 0.5]
    double texture_strength = 0.04;       // [0, 0.5]

    // Rock exposure on steep slopes
    core::Rgb rock_color{0.50, 0.47, 0.44};
    double rock_slope_start = 0.35;       // [0, rock_slope_full)
    double rock_slope_full = 1.0;         // (rock_slope_start, 10]
    double rock_fade_start = 170.0;       // exposure fades out above this height
    double rock_fade_end = 200.0;         // (rock_fade_start, ...]

    // Hard floor against dark peaks
    double peak_brightness_height = 150.0;
    double rock_brightness_floor = 0.38;  // [0, 1]
};

/**
 * @brief Maps terrain samples to colours.
 *
 * Pure and const: safe to call from several threads at once.
 * Non-finite inputs are treated as 0; every output channel is in [0, 1].
 */
class BiomeClassifier {
public:
    BiomeClassifier(const NoiseGenerator& noise, const BiomeConfig& config);

    core::Rgb get_biome_color(double x, double z, double height, double slope) const;

    /**
     * @brief Colour of a single band for a moisture value in [0, 1].
     */
    core::Rgb band_color(size_t index, double moisture) const;

    /**
     * @brief Moisture field in [0, 1] at a world position.
     */
    double moisture(double x, double z) const;

    const BiomeConfig& config() const { return config_; }

private:
    const NoiseGenerator& noise_;
    BiomeConfig config_;

    core::Rgb blend_bands(double height, double moisture) const;
};

} // namespace terrain
} // namespace skycarpet
