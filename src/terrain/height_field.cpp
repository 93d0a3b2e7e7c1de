/**
 * @file height_field.cpp
 * @brief Continuous terrain height composition.
 */

#include <skycarpet/core/constants.hpp>
#include <skycarpet/core/math.hpp>
#include <skycarpet/terrain/fractal_noise.hpp>
#include <skycarpet/terrain/height_field.hpp>

#include <algorithm>
#include <cmath>

namespace skycarpet {
namespace terrain {

using core::lerp;
using core::normalized_sigmoid;
using core::smoothstep;

HeightField::HeightField(const NoiseGenerator& noise, const HeightFieldConfig& config)
    : noise_(noise), config_(config) {}

double HeightField::continent_mask(double x, double z) const {
    if (!std::isfinite(x) || !std::isfinite(z)) return 0.0;
    double shape = fractal_noise(noise_, x, z, config_.continent_frequency,
                                 config_.continent_octaves, 0.5, 2.0,
                                 NoiseChannel::CONTINENT);
    double mask = (shape + config_.continent_bias) * config_.continent_gain;
    return std::clamp(mask, 0.0, 1.0);
}

double HeightField::valley_height(double x, double z, double mask,
                                  double plains_blend) const {
    double rise = 1.0;
    if (config_.transition_start > 0.0) {
        rise = normalized_sigmoid(mask / config_.transition_start, config_.sigmoid_steepness);
    }
    double h = lerp(config_.valley_floor_height, config_.valley_baseline, rise);

    // Two-frequency ripple on the floor, faded out as plains take over
    double f = config_.valley_noise_frequency;
    DomainOffset a = noise_.octave_offset(NoiseChannel::VALLEY, 0);
    DomainOffset b = noise_.octave_offset(NoiseChannel::VALLEY, 1);
    double ripple = 0.65 * noise_.noise2d(x * f + a.dx, z * f + a.dz) +
                    0.35 * noise_.noise2d(x * f * 3.7 + b.dx, z * f * 3.7 + b.dz);
    h += ripple * config_.valley_noise_amplitude * (1.0 - plains_blend);
    return h;
}

double HeightField::plains_height(double x, double z) const {
    double n = fractal_noise(noise_, x, z, config_.plains_frequency,
                             config_.plains_octaves, 0.5, 2.0, NoiseChannel::PLAINS);
    return config_.plains_baseline + (n + 1.0) * 0.5 * config_.plains_height;
}

double HeightField::mountain_height(double x, double z, double mask) const {
    double weight = smoothstep(config_.mountain_mask_start, config_.mountain_mask_full, mask);
    if (weight <= 0.0) return 0.0;

    double range = fractal_noise(noise_, x, z, config_.range_frequency, 2, 0.5, 2.0,
                                 NoiseChannel::RANGE);
    weight *= smoothstep(config_.range_low, config_.range_high, range);
    if (weight <= 0.0) return 0.0;

    double ridge = ridged_noise(noise_, x, z, config_.mountain_frequency,
                                config_.mountain_octaves, config_.mountain_sharpness,
                                NoiseChannel::MOUNTAIN);
    return ridge * config_.mountain_height * weight;
}

double HeightField::apply_soft_limit(double h) const {
    double margin = config_.soft_limit_margin;
    if (margin <= 0.0) return std::clamp(h, config_.min_height, config_.max_height);

    double upper = config_.max_height - margin;
    double lower = config_.min_height + margin;
    if (h > upper) {
        h = upper + margin * std::tanh((h - upper) / margin);
    } else if (h < lower) {
        h = lower - margin * std::tanh((lower - h) / margin);
    }
    return h;
}

double HeightField::get_terrain_height(double x, double z) const {
    if (!std::isfinite(x) || !std::isfinite(z)) return constants::FALLBACK_HEIGHT;

    double mask = continent_mask(x, z);

    double span = config_.transition_end - config_.transition_start;
    double t = span > 0.0 ? (mask - config_.transition_start) / span
                          : (mask >= config_.transition_start ? 1.0 : 0.0);
    double plains_blend = normalized_sigmoid(t, config_.sigmoid_steepness);

    double valley = valley_height(x, z, mask, plains_blend);
    double h = lerp(valley, plains_height(x, z), plains_blend);

    h += mountain_height(x, z, mask);

    double detail = fractal_noise(noise_, x, z, config_.detail_frequency,
                                  config_.detail_octaves, 0.5, 2.0, NoiseChannel::DETAIL);
    h += detail * config_.detail_height;

    h = apply_soft_limit(h);
    return std::isfinite(h) ? h : constants::FALLBACK_HEIGHT;
}

} // namespace terrain
} // namespace skycarpet
