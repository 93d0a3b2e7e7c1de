#pragma once

/**
 * @file math.hpp
 * @brief Small vector/colour types and interpolation helpers.
 */

#include <algorithm>
#include <cmath>

namespace skycarpet {
namespace core {

struct Vec3 {
    double x = 0.0, y = 0.0, z = 0.0;

    Vec3() = default;
    Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }
    Vec3& operator+=(const Vec3& o) { x += o.x; y += o.y; z += o.z; return *this; }

    double dot(const Vec3& o) const { return x * o.x + y * o.y + z * o.z; }
    Vec3 cross(const Vec3& o) const {
        return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x};
    }
    double length() const { return std::sqrt(x * x + y * y + z * z); }
    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }
};

/**
 * @brief Linear RGB colour, channels nominally in [0, 1].
 */
struct Rgb {
    double r = 0.0, g = 0.0, b = 0.0;
};

inline double lerp(double a, double b, double t) { return a + (b - a) * t; }

inline Rgb lerp(const Rgb& a, const Rgb& b, double t) {
    return {lerp(a.r, b.r, t), lerp(a.g, b.g, t), lerp(a.b, b.b, t)};
}

inline Rgb clamp01(const Rgb& c) {
    return {std::clamp(c.r, 0.0, 1.0), std::clamp(c.g, 0.0, 1.0),
            std::clamp(c.b, 0.0, 1.0)};
}

inline double smoothstep(double edge0, double edge1, double x) {
    if (edge1 <= edge0) return x < edge0 ? 0.0 : 1.0;
    double t = std::clamp((x - edge0) / (edge1 - edge0), 0.0, 1.0);
    return t * t * (3.0 - 2.0 * t);
}

/**
 * @brief Quintic smoothstep: C2-continuous, zero slope and curvature at both ends.
 */
inline double smootherstep(double edge0, double edge1, double x) {
    if (edge1 <= edge0) return x < edge0 ? 0.0 : 1.0;
    double t = std::clamp((x - edge0) / (edge1 - edge0), 0.0, 1.0);
    return t * t * t * (t * (t * 6.0 - 15.0) + 10.0);
}

/**
 * @brief Logistic curve on [0, 1] rescaled so that S(0) = 0 and S(1) = 1.
 *
 * steepness controls how quickly the curve rises around t = 0.5; t is
 * clamped into [0, 1].
 */
inline double normalized_sigmoid(double t, double steepness) {
    t = std::clamp(t, 0.0, 1.0);
    if (steepness <= 0.0) return t;
    auto s = [steepness](double v) {
        return 1.0 / (1.0 + std::exp(-(steepness * v - steepness * 0.5)));
    };
    double s0 = s(0.0);
    double s1 = s(1.0);
    return (s(t) - s0) / (s1 - s0);
}

/**
 * @brief Normalize a vector, falling back when it is degenerate or non-finite.
 */
inline Vec3 normalize_or(const Vec3& v, const Vec3& fallback, double epsilon) {
    if (!v.is_finite()) return fallback;
    double len = v.length();
    if (!(len > epsilon)) return fallback;
    return v * (1.0 / len);
}

inline double finite_or(double v, double fallback) {
    return std::isfinite(v) ? v : fallback;
}

}  // namespace core
}  // namespace skycarpet
