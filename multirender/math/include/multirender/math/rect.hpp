#pragma once

#include <multirender/math/point.hpp>
#include <multirender/math/shape.hpp>
#include <multirender/float.hpp>
#include <algorithm>

namespace multirender {

struct Rect final : Shape {
  f64 x0{};
  f64 y0{};
  f64 x1{};
  f64 y1{};

  Rect() = default;
  Rect(f64 x0, f64 y0, f64 x1, f64 y1) : x0{x0}, y0{y0}, x1{x1}, y1{y1} {}

  static Rect FromOriginSize(const Point& origin, f64 width, f64 height) {
    return Rect{origin.x, origin.y, origin.x + width, origin.y + height}.Abs();
  }

  static Rect FromPoints(const Point& p0, const Point& p1) {
    return Rect{p0.x, p0.y, p1.x, p1.y}.Abs();
  }

  [[nodiscard]] f64 Width() const { return x1 - x0; }
  [[nodiscard]] f64 Height() const { return y1 - y0; }
  [[nodiscard]] f64 Area() const { return Width() * Height(); }
  [[nodiscard]] Point Origin() const { return {x0, y0}; }
  [[nodiscard]] Point Center() const { return {(x0 + x1) * 0.5, (y0 + y1) * 0.5}; }

  [[nodiscard]] bool IsEmpty() const {
    return Area() <= 0.0;
  }

  [[nodiscard]] bool Contains(const Point& point) const {
    return point.x >= x0 && point.x < x1 && point.y >= y0 && point.y < y1;
  }

  /// @returns the same rectangle with x0 <= x1 and y0 <= y1
  [[nodiscard]] Rect Abs() const {
    return {std::min(x0, x1), std::min(y0, y1), std::max(x0, x1), std::max(y0, y1)};
  }

  [[nodiscard]] Rect Union(const Rect& other) const {
    return {std::min(x0, other.x0), std::min(y0, other.y0), std::max(x1, other.x1), std::max(y1, other.y1)};
  }

  /// @returns the overlapping area of both rectangles, which is empty (but not necessarily zero) if they do not overlap
  [[nodiscard]] Rect Intersect(const Rect& other) const {
    const f64 ix0 = std::max(x0, other.x0);
    const f64 iy0 = std::max(y0, other.y0);
    return {ix0, iy0, std::max(ix0, std::min(x1, other.x1)), std::max(iy0, std::min(y1, other.y1))};
  }

  [[nodiscard]] Rect Inflate(f64 width, f64 height) const {
    return {x0 - width, y0 - height, x1 + width, y1 + height};
  }

  [[nodiscard]] BezPath ToPath(f64 tolerance) const override;

  [[nodiscard]] Rect BoundingBox() const override {
    return Abs();
  }

  bool operator==(const Rect& other) const {
    return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 && y1 == other.y1;
  }
};

} // namespace multirender
