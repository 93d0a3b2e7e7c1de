#pragma once

/**
 * @file height_field.hpp
 * @brief Layered terrain height synthesis.
 *
 * Height is composed from one continuous formula:
 *   continent mask -> valley floor -> sigmoid beach/plains transition
 *   -> masked ridged mountains -> detail -> soft limit.
 * There are no hard thresholds, so neighbouring samples never jump.
 */

#include <skycarpet/terrain/noise.hpp>

namespace skycarpet {
namespace terrain {

/**
 * @brief Configuration for terrain height synthesis.
 *
 * Valid ranges are given next to each field; core::sanitize() enforces them.
 */
struct HeightFieldConfig {
    uint32_t seed = 42;

    // Output bounds
    double min_height = -40.0;           // < max_height
    double max_height = 300.0;           // > min_height
    double soft_limit_margin = 20.0;     // [0, (max-min)/2], tanh band near each bound

    // Continental mask: clamp((fbm + bias) * gain, 0, 1)
    double continent_frequency = 0.00005; // (0, 0.01]
    int continent_octaves = 3;            // [1, 16]
    double continent_bias = 0.3;          // [-1, 1]
    double continent_gain = 1.2;          // (0, 10]

    // Beach -> plains transition over the mask domain
    double transition_start = 0.10;       // [0, 1)
    double transition_end = 0.38;         // (transition_start, 1]
    double sigmoid_steepness = 6.0;       // [0, 20], 0 = linear

    // Valley floor (below transition_start)
    double valley_floor_height = -25.0;
    double valley_baseline = -2.0;
    double valley_noise_amplitude = 1.5;  // [0, 20]
    double valley_noise_frequency = 0.03; // (0, 1], second layer runs ~3.7x faster

    // Plains
    double plains_baseline = 12.0;
    double plains_height = 28.0;          // [0, 200]
    double plains_frequency = 0.0035;     // (0, 0.1]
    int plains_octaves = 4;               // [1, 16]

    // Mountains
    double mountain_frequency = 0.004;    // (0, 0.1]
    int mountain_octaves = 4;             // [1, 16]
    double mountain_height = 240.0;       // [0, 1000]
    double mountain_sharpness = 1.2;      // [0.5, 4]
    double mountain_mask_start = 0.30;    // mask where mountains begin
    double mountain_mask_full = 0.70;     // mask where mountains reach full weight
    double range_frequency = 0.0007;      // clusters mountains into ranges
    double range_low = -0.15;
    double range_high = 0.35;

    // Detail, applied everywhere
    double detail_frequency = 0.019;      // (0, 1]
    int detail_octaves = 2;               // [1, 16]
    double detail_height = 6.0;           // [0, 50]
};

/**
 * @brief Pure function (x, z) -> height over a shared noise generator.
 *
 * Holds a reference to the noise generator; the generator must outlive
 * the field. Never returns NaN: degenerate samples fall back to sea level.
 */
class HeightField {
public:
    HeightField(const NoiseGenerator& noise, const HeightFieldConfig& config);

    double get_terrain_height(double x, double z) const;

    /**
     * @brief Continental mask in [0, 1]; 0 is open valley/sea floor.
     */
    double continent_mask(double x, double z) const;

    const HeightFieldConfig& config() const { return config_; }

private:
    const NoiseGenerator& noise_;
    HeightFieldConfig config_;

    double valley_height(double x, double z, double mask, double plains_blend) const;
    double plains_height(double x, double z) const;
    double mountain_height(double x, double z, double mask) const;
    double apply_soft_limit(double h) const;
};

} // namespace terrain
} // namespace skycarpet
