/**
 * @file fractal_noise.cpp
 * @brief fBm and ridged multifractal implementations.
 */

#include <skycarpet/core/constants.hpp>
#include <skycarpet/terrain/fractal_noise.hpp>

#include <algorithm>
#include <cmath>

namespace skycarpet {
namespace terrain {

double fractal_noise(const NoiseGenerator& noise, double x, double z,
                     double base_frequency, int octaves, double persistence,
                     double lacunarity, NoiseChannel channel) {
    if (octaves <= 0) return 0.0;
    octaves = std::min(octaves, constants::MAX_OCTAVES);

    double value = 0.0;
    double amplitude = 1.0;
    double frequency = base_frequency;
    double max_value = 0.0;

    for (int i = 0; i < octaves; ++i) {
        DomainOffset off = noise.octave_offset(channel, i);
        value += amplitude * noise.noise2d(x * frequency + off.dx, z * frequency + off.dz);
        max_value += amplitude;
        amplitude *= persistence;
        frequency *= lacunarity;
    }

    if (!(max_value > 0.0)) return 0.0;
    return std::clamp(value / max_value, -1.0, 1.0);
}

double ridged_noise(const NoiseGenerator& noise, double x, double z,
                    double frequency, int octaves, double sharpness,
                    NoiseChannel channel) {
    if (octaves <= 0) return 0.0;
    octaves = std::min(octaves, constants::MAX_OCTAVES);

    double value = 0.0;
    double amplitude = 1.0;
    double max_value = 0.0;
    double weight = 1.0;

    for (int i = 0; i < octaves; ++i) {
        DomainOffset off = noise.octave_offset(channel, i);
        double n = noise.noise2d(x * frequency + off.dx, z * frequency + off.dz);
        n = std::pow(std::max(0.0, 1.0 - std::abs(n)), sharpness);
        n *= weight;
        weight = std::clamp(n, 0.0, 1.0);

        value += n * amplitude;
        max_value += amplitude;
        frequency *= 2.0;
        amplitude *= 0.5;
    }

    return std::clamp(value / max_value, 0.0, 1.0);
}

} // namespace terrain
} // namespace skycarpet
