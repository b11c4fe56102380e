#pragma once

#include <multirender/paint/color.hpp>
#include <multirender/paint/gradient.hpp>
#include <multirender/paint/image.hpp>
#include <multirender/float.hpp>
#include <multirender/integer.hpp>
#include <variant>

namespace multirender {

/**
 * A paint whose pixels are produced outside of MultiRender, for example a texture rendered by
 * another GPU pipeline. Backends that cannot resolve the source render it transparent.
 */
struct CustomPaint {
  u64 source_id{};
  u32 width{};
  u32 height{};
  f64 scale{1.0};

  bool operator==(const CustomPaint& other) const = default;
};

using Paint = std::variant<Color, Gradient, ImageBrush, CustomPaint>;

} // namespace multirender
