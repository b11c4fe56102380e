#pragma once

#include <multirender/float.hpp>
#include <cmath>

namespace multirender {

struct Vec2 {
  f64 x{};
  f64 y{};

  Vec2() = default;
  Vec2(f64 x, f64 y) : x{x}, y{y} {}

  Vec2 operator+(const Vec2& other) const { return {x + other.x, y + other.y}; }
  Vec2 operator-(const Vec2& other) const { return {x - other.x, y - other.y}; }
  Vec2 operator*(f64 scale) const { return {x * scale, y * scale}; }
  Vec2 operator-() const { return {-x, -y}; }

  Vec2& operator+=(const Vec2& other) {
    x += other.x;
    y += other.y;
    return *this;
  }

  [[nodiscard]] f64 Dot(const Vec2& other) const {
    return x * other.x + y * other.y;
  }

  /// @returns the z component of the 3D cross product of both vectors
  [[nodiscard]] f64 Cross(const Vec2& other) const {
    return x * other.y - y * other.x;
  }

  [[nodiscard]] f64 Length() const {
    return std::hypot(x, y);
  }

  [[nodiscard]] Vec2 Normalized() const {
    const f64 length = Length();
    if(length == 0.0) {
      return {};
    }
    return {x / length, y / length};
  }

  /// @returns the vector rotated by 90 degrees (counter-clockwise in a y-up coordinate system)
  [[nodiscard]] Vec2 Perpendicular() const {
    return {-y, x};
  }

  bool operator==(const Vec2& other) const = default;
};

struct Point {
  f64 x{};
  f64 y{};

  Point() = default;
  Point(f64 x, f64 y) : x{x}, y{y} {}

  Point operator+(const Vec2& vec) const { return {x + vec.x, y + vec.y}; }
  Point operator-(const Vec2& vec) const { return {x - vec.x, y - vec.y}; }
  Vec2 operator-(const Point& other) const { return {x - other.x, y - other.y}; }

  [[nodiscard]] Vec2 ToVec2() const {
    return {x, y};
  }

  [[nodiscard]] Point Lerp(const Point& other, f64 t) const {
    return {x + (other.x - x) * t, y + (other.y - y) * t};
  }

  [[nodiscard]] f64 Distance(const Point& other) const {
    return (other - *this).Length();
  }

  bool operator==(const Point& other) const = default;
};

} // namespace multirender
