#pragma once

/**
 * @file fractal_noise.hpp
 * @brief Multi-octave combinators built on NoiseGenerator.
 */

#include <skycarpet/terrain/noise.hpp>

namespace skycarpet {
namespace terrain {

/**
 * @brief Fractal Brownian motion, normalised by the total amplitude.
 *
 * Each octave multiplies frequency by lacunarity and amplitude by
 * persistence. Result lies in [-1, 1]; octaves <= 0 yields 0.
 */
double fractal_noise(const NoiseGenerator& noise, double x, double z,
                     double base_frequency, int octaves,
                     double persistence = 0.5, double lacunarity = 2.0,
                     NoiseChannel channel = NoiseChannel::CONTINENT);

/**
 * @brief Ridged multifractal with per-octave weighting.
 *
 * Each octave contributes pow(1 - |n|, sharpness) scaled by the previous
 * octave's value, so ridges stay sharp while valleys stay smooth.
 * Frequency doubles and amplitude halves per octave. Result lies in [0, 1].
 */
double ridged_noise(const NoiseGenerator& noise, double x, double z,
                    double frequency, int octaves, double sharpness = 1.2,
                    NoiseChannel channel = NoiseChannel::MOUNTAIN);

} // namespace terrain
} // namespace skycarpet
