/**
 * @file noise.cpp
 * @brief Perlin noise with overflow-safe lattice wrapping.
 */

#include <skycarpet/core/constants.hpp>
#include <skycarpet/terrain/noise.hpp>

#include <algorithm>
#include <cmath>
#include <random>

namespace skycarpet {
namespace terrain {

namespace {

uint64_t mix64(uint64_t z) {
    z += 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

// Wraps a lattice coordinate into [0, 256) before any integer conversion.
int wrap_cell(double v) {
    double cell = std::floor(v);
    double wrapped = cell - constants::NOISE_WRAP * std::floor(cell / constants::NOISE_WRAP);
    int i = static_cast<int>(wrapped);
    return std::clamp(i, 0, 255);
}

} // namespace

NoiseGenerator::NoiseGenerator(uint32_t seed) : seed_(seed) {
    std::mt19937 rng(seed);

    for (int i = 0; i < 256; ++i) {
        perm_[i] = static_cast<uint8_t>(i);
    }
    std::shuffle(perm_.begin(), perm_.begin() + 256, rng);

    // Duplicate for overflow
    for (int i = 0; i < 256; ++i) {
        perm_[256 + i] = perm_[i];
    }
}

double NoiseGenerator::grad(int hash, double x, double z) {
    switch (hash & 7) {
        case 0: return  x + z;
        case 1: return -x + z;
        case 2: return  x - z;
        case 3: return -x - z;
        case 4: return  x;
        case 5: return -x;
        case 6: return  z;
        default: return -z;
    }
}

double NoiseGenerator::noise2d(double x, double z) const {
    if (!std::isfinite(x) || !std::isfinite(z)) return 0.0;

    int X = wrap_cell(x);
    int Z = wrap_cell(z);

    double fx = x - std::floor(x);
    double fz = z - std::floor(z);

    double u = fade(fx);
    double v = fade(fz);

    int A = perm_[X] + Z;
    int B = perm_[X + 1] + Z;

    double value = lerp(v,
        lerp(u, grad(perm_[A], fx, fz), grad(perm_[B], fx - 1, fz)),
        lerp(u, grad(perm_[A + 1], fx, fz - 1), grad(perm_[B + 1], fx - 1, fz - 1)));

    return std::clamp(value, -1.0, 1.0);
}

DomainOffset NoiseGenerator::octave_offset(NoiseChannel channel, int octave) const {
    uint64_t key = (static_cast<uint64_t>(seed_) << 32) ^
                   (static_cast<uint64_t>(channel) << 16) ^
                   static_cast<uint64_t>(static_cast<uint32_t>(octave));
    uint64_t hx = mix64(key);
    uint64_t hz = mix64(hx ^ 0xD1B54A32D192ED03ULL);

    // Offsets span a few permutation periods; fractional part breaks lattice alignment
    DomainOffset off;
    off.dx = static_cast<double>(hx % 1000003ULL) * 0.001 - 500.0;
    off.dz = static_cast<double>(hz % 1000003ULL) * 0.001 - 500.0;
    return off;
}

} // namespace terrain
} // namespace skycarpet
