/**
 * @file biome_classifier.cpp
 * @brief Band table evaluation with shared texture noise and rock exposure.
 */

#include <skycarpet/core/math.hpp>
#include <skycarpet/terrain/biome_classifier.hpp>
#include <skycarpet/terrain/fractal_noise.hpp>

#include <algorithm>
#include <cmath>

namespace skycarpet {
namespace terrain {

using core::Rgb;
using core::lerp;
using core::smoothstep;
using core::smootherstep;

std::vector<BiomeBand> default_biome_bands() {
    // name, start height, blend width, dry tone, lush tone
    return {
        {"valley_floor", -1e9, 0.0, {0.55, 0.47, 0.34}, {0.42, 0.38, 0.28}},
        {"wet_sand",      0.0, 3.0, {0.76, 0.70, 0.50}, {0.68, 0.62, 0.45}},
        {"dry_sand",      4.0, 4.0, {0.86, 0.80, 0.58}, {0.80, 0.76, 0.55}},
        {"sandy_grass",  10.0, 6.0, {0.66, 0.68, 0.40}, {0.52, 0.64, 0.34}},
        {"light_grass",  16.0, 6.0, {0.55, 0.66, 0.32}, {0.40, 0.62, 0.28}},
        {"plains",       22.0, 8.0, {0.58, 0.60, 0.30}, {0.30, 0.55, 0.22}},
        {"forest",       60.0, 20.0, {0.30, 0.42, 0.20}, {0.16, 0.36, 0.14}},
        {"high_rock",   130.0, 30.0, {0.56, 0.53, 0.50}, {0.50, 0.49, 0.47}},
        {"snow",        185.0, 40.0, {0.93, 0.94, 0.96}, {0.97, 0.98, 1.00}},
    };
}

BiomeClassifier::BiomeClassifier(const NoiseGenerator& noise, const BiomeConfig& config)
    : noise_(noise), config_(config) {}

double BiomeClassifier::moisture(double x, double z) const {
    double m = fractal_noise(noise_, x, z, config_.moisture_frequency, 3, 0.5, 2.0,
                             NoiseChannel::MOISTURE);
    return std::clamp((m + 1.0) * 0.5, 0.0, 1.0);
}

Rgb BiomeClassifier::band_color(size_t index, double moisture) const {
    if (index >= config_.bands.size()) return {};
    const BiomeBand& band = config_.bands[index];
    return lerp(band.dry_color, band.lush_color, smoothstep(0.3, 0.7, moisture));
}

Rgb BiomeClassifier::blend_bands(double height, double moisture) const {
    if (config_.bands.empty()) return {};

    Rgb color = band_color(0, moisture);
    for (size_t i = 1; i < config_.bands.size(); ++i) {
        const BiomeBand& band = config_.bands[i];
        double half = band.blend_width * 0.5;
        double w = smootherstep(band.start_height - half, band.start_height + half, height);
        if (w <= 0.0) break;  // bands are ordered; later ones start higher
        color = lerp(color, band_color(i, moisture), w);
    }
    return color;
}

Rgb BiomeClassifier::get_biome_color(double x, double z, double height,
                                     double slope) const {
    x = core::finite_or(x, 0.0);
    z = core::finite_or(z, 0.0);
    height = core::finite_or(height, 0.0);
    slope = std::max(0.0, core::finite_or(slope, 0.0));

    // Shared samples: every band sees the same moisture and texture at (x, z)
    double wet = moisture(x, z);
    double tone = fractal_noise(noise_, x, z, config_.tone_frequency, 2, 0.5, 2.0,
                                NoiseChannel::TONE);
    double grain = fractal_noise(noise_, x, z, config_.texture_frequency, 2, 0.5, 2.0,
                                 NoiseChannel::TEXTURE);
    double brightness = 1.0 + tone * config_.tone_strength + grain * config_.texture_strength;

    Rgb color = blend_bands(height, wet);

    double exposure = smoothstep(config_.rock_slope_start, config_.rock_slope_full, slope) *
                      (1.0 - smoothstep(config_.rock_fade_start, config_.rock_fade_end, height));
    exposure *= 0.85 + 0.15 * grain;
    if (exposure > 0.0) {
        color = lerp(color, config_.rock_color, std::clamp(exposure, 0.0, 1.0));
    }

    color = {color.r * brightness, color.g * brightness, color.b * brightness};

    if (height >= config_.peak_brightness_height) {
        double floor = config_.rock_brightness_floor;
        color.r = std::max(color.r, floor);
        color.g = std::max(color.g, floor);
        color.b = std::max(color.b, floor);
    }

    return core::clamp01(color);
}

} // namespace terrain
} // namespace skycarpet
