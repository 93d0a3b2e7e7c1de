#pragma once

/**
 * @file noise.hpp
 * @brief Seeded 2D gradient noise primitive shared by every terrain layer.
 */

#include <array>
#include <cstdint>

namespace skycarpet {
namespace terrain {

/**
 * @brief Independent noise channels.
 *
 * Each channel samples the same primitive through its own seed-derived domain
 * offsets, so layers built on different channels are decorrelated.
 */
enum class NoiseChannel : uint32_t {
    CONTINENT = 0,
    RANGE,
    PLAINS,
    MOUNTAIN,
    DETAIL,
    VALLEY,
    MOISTURE,
    TONE,
    TEXTURE,
    PLACEMENT
};

struct DomainOffset {
    double dx = 0.0;
    double dz = 0.0;
};

/**
 * @brief Perlin noise over a 256-cell permutation lattice.
 *
 * Output is continuous, deterministic for a given seed and lies in [-1, 1].
 * Non-finite coordinates return 0.
 */
class NoiseGenerator {
public:
    explicit NoiseGenerator(uint32_t seed = 0);

    double noise2d(double x, double z) const;

    /**
     * @brief Deterministic domain offset for one octave of one channel.
     */
    DomainOffset octave_offset(NoiseChannel channel, int octave) const;

    uint32_t seed() const { return seed_; }

private:
    uint32_t seed_;
    std::array<uint8_t, 512> perm_;

    static double fade(double t) { return t * t * t * (t * (t * 6 - 15) + 10); }
    static double lerp(double t, double a, double b) { return a + t * (b - a); }
    static double grad(int hash, double x, double z);
};

} // namespace terrain
} // namespace skycarpet
