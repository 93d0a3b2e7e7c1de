#pragma once

/**
 * @file color_maps.hpp
 * @brief Color conversion and overlay gradients for terrain visualization.
 */

#include "raylib.h"
#include <skycarpet/core/math.hpp>
#include <algorithm>
#include <cmath>

namespace skycarpet {
namespace renderer {

/**
 * @brief Linearly interpolate between two colors.
 */
inline Color lerp_color(Color a, Color b, float t) {
  t = std::clamp(t, 0.0f, 1.0f);
  return {static_cast<unsigned char>(a.r + (b.r - a.r) * t),
          static_cast<unsigned char>(a.g + (b.g - a.g) * t),
          static_cast<unsigned char>(a.b + (b.b - a.b) * t),
          static_cast<unsigned char>(a.a + (b.a - a.a) * t)};
}

/**
 * @brief Convert a [0, 1] RGB triple to an 8-bit raylib color.
 */
inline Color to_color(const core::Rgb &c, float brightness = 1.0f) {
  auto channel = [brightness](double v) {
    double scaled = std::clamp(v * brightness, 0.0, 1.0);
    return static_cast<unsigned char>(std::lround(scaled * 255.0));
  };
  return {channel(c.r), channel(c.g), channel(c.b), 255};
}

/**
 * @brief Map terrain height to color (deep blue -> green -> brown -> white).
 */
inline Color height_to_color(double height, double min_h = -40.0,
                             double max_h = 300.0) {
  double normalized = (height - min_h) / (max_h - min_h);
  normalized = std::clamp(normalized, 0.0, 1.0);

  if (normalized < 0.25) {
    float t = static_cast<float>(normalized * 4.0);
    return lerp_color({10, 30, 120, 255}, {40, 160, 90, 255}, t);
  } else if (normalized < 0.5) {
    float t = static_cast<float>((normalized - 0.25) * 4.0);
    return lerp_color({40, 160, 90, 255}, {200, 190, 60, 255}, t);
  } else if (normalized < 0.75) {
    float t = static_cast<float>((normalized - 0.5) * 4.0);
    return lerp_color({200, 190, 60, 255}, {140, 90, 50, 255}, t);
  } else {
    float t = static_cast<float>((normalized - 0.75) * 4.0);
    return lerp_color({140, 90, 50, 255}, {250, 250, 250, 255}, t);
  }
}

/**
 * @brief Map slope (gradient magnitude) to color (green=flat, red=cliff).
 */
inline Color slope_to_color(double slope, double max_slope = 1.5) {
  double normalized = std::clamp(slope / max_slope, 0.0, 1.0);
  if (normalized < 0.5) {
    float t = static_cast<float>(normalized * 2.0);
    return lerp_color({40, 200, 80, 255}, {240, 220, 40, 255}, t);
  }
  float t = static_cast<float>((normalized - 0.5) * 2.0);
  return lerp_color({240, 220, 40, 255}, {220, 40, 30, 255}, t);
}

} // namespace renderer
} // namespace skycarpet
