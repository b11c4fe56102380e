#include <multirender/paint/color.hpp>
#include <algorithm>
#include <cmath>

namespace multirender {

Color PremulColor::Unpremultiply() const {
  if(a <= 0.0f) {
    return {0.0f, 0.0f, 0.0f, 0.0f};
  }
  const f32 inv_a = 1.0f / a;
  return {r * inv_a, g * inv_a, b * inv_a, a};
}

std::array<u8, 4> Color::ToRgba8() const {
  const auto to_u8 = [](f32 value) {
    return (u8)std::lround(std::clamp(value, 0.0f, 1.0f) * 255.0f);
  };
  return {to_u8(r), to_u8(g), to_u8(b), to_u8(a)};
}

} // namespace multirender
