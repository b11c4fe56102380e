#pragma once

#include <multirender/float.hpp>
#include <vector>

namespace multirender {

enum class Join {
  Bevel,
  Miter,
  Round
};

enum class Cap {
  Butt,
  Square,
  Round
};

/**
 * Describes how the outline of a shape is stroked.
 */
struct StrokeStyle {
  f64 width{1.0};
  Join join{Join::Round};
  f64 miter_limit{4.0};
  Cap start_cap{Cap::Round};
  Cap end_cap{Cap::Round};
  std::vector<f64> dash_pattern{};
  f64 dash_offset{0.0};

  StrokeStyle() = default;
  explicit StrokeStyle(f64 width) : width{width} {}

  StrokeStyle& WithJoin(Join new_join) {
    join = new_join;
    return *this;
  }

  StrokeStyle& WithMiterLimit(f64 limit) {
    miter_limit = limit;
    return *this;
  }

  StrokeStyle& WithCaps(Cap cap) {
    start_cap = cap;
    end_cap = cap;
    return *this;
  }

  StrokeStyle& WithDashes(f64 offset, std::vector<f64> pattern) {
    dash_offset = offset;
    dash_pattern = std::move(pattern);
    return *this;
  }

  bool operator==(const StrokeStyle& other) const = default;
};

} // namespace multirender
