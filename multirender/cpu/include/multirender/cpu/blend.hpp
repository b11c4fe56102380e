#pragma once

#include <multirender/paint/blend_mode.hpp>
#include <multirender/paint/color.hpp>

namespace multirender {

/**
 * Composites `src` onto `dst` (both premultiplied): the colors are first mixed with the
 * separable or non-separable blend function and the result is then composed with the Porter-Duff operator.
 */
PremulColor blend(const PremulColor& src, const PremulColor& dst, const BlendMode& mode);

/// Fast path for Normal / SrcOver.
inline PremulColor blend_src_over(const PremulColor& src, const PremulColor& dst) {
  const f32 inv_a = 1.0f - src.a;
  return {src.r + dst.r * inv_a, src.g + dst.g * inv_a, src.b + dst.b * inv_a, src.a + dst.a * inv_a};
}

} // namespace multirender
