#pragma once

#include <multirender/math/stroke.hpp>
#include <multirender/integer.hpp>
#include <variant>

namespace multirender {

/// Rule that decides which regions of a self-intersecting path are inside.
enum class FillRule : u8 {
  NonZero,
  EvenOdd
};

using Style = std::variant<FillRule, StrokeStyle>;

} // namespace multirender
