#pragma once

#include <multirender/float.hpp>
#include <multirender/integer.hpp>
#include <array>

namespace multirender {

struct Color;

/// A color with premultiplied alpha, used where colors are composited.
struct PremulColor {
  f32 r{};
  f32 g{};
  f32 b{};
  f32 a{};

  [[nodiscard]] Color Unpremultiply() const;

  PremulColor operator*(f32 scale) const {
    return {r * scale, g * scale, b * scale, a * scale};
  }

  bool operator==(const PremulColor& other) const = default;
};

/**
 * An sRGB color with separate (straight) alpha, each component in the range [0, 1].
 */
struct Color {
  f32 r{};
  f32 g{};
  f32 b{};
  f32 a{};

  constexpr Color() = default;
  constexpr Color(f32 r, f32 g, f32 b, f32 a = 1.0f) : r{r}, g{g}, b{b}, a{a} {}

  static constexpr Color FromRgba8(u8 r, u8 g, u8 b, u8 a = 255u) {
    return {(f32)r / 255.0f, (f32)g / 255.0f, (f32)b / 255.0f, (f32)a / 255.0f};
  }

  [[nodiscard]] constexpr Color WithAlpha(f32 alpha) const {
    return {r, g, b, alpha};
  }

  [[nodiscard]] constexpr Color MultiplyAlpha(f32 factor) const {
    return {r, g, b, a * factor};
  }

  [[nodiscard]] std::array<u8, 4> ToRgba8() const;

  [[nodiscard]] PremulColor Premultiply() const {
    return {r * a, g * a, b * a, a};
  }

  /// Component-wise linear interpolation.
  [[nodiscard]] Color Lerp(const Color& other, f32 t) const {
    return {r + (other.r - r) * t, g + (other.g - g) * t, b + (other.b - b) * t, a + (other.a - a) * t};
  }

  bool operator==(const Color& other) const = default;
};

namespace palette::css {

inline constexpr Color TRANSPARENT{0.0f, 0.0f, 0.0f, 0.0f};
inline constexpr Color BLACK = Color::FromRgba8(0, 0, 0);
inline constexpr Color WHITE = Color::FromRgba8(255, 255, 255);
inline constexpr Color RED = Color::FromRgba8(255, 0, 0);
inline constexpr Color LIME = Color::FromRgba8(0, 255, 0);
inline constexpr Color GREEN = Color::FromRgba8(0, 128, 0);
inline constexpr Color BLUE = Color::FromRgba8(0, 0, 255);
inline constexpr Color YELLOW = Color::FromRgba8(255, 255, 0);
inline constexpr Color CYAN = Color::FromRgba8(0, 255, 255);
inline constexpr Color MAGENTA = Color::FromRgba8(255, 0, 255);
inline constexpr Color GRAY = Color::FromRgba8(128, 128, 128);
inline constexpr Color ORANGE = Color::FromRgba8(255, 165, 0);
inline constexpr Color CORNFLOWER_BLUE = Color::FromRgba8(100, 149, 237);

} // namespace multirender::palette::css

} // namespace multirender
