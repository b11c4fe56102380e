#pragma once

#include <multirender/math/rect.hpp>
#include <multirender/math/shape.hpp>

namespace multirender {

struct RoundedRectRadii {
  f64 top_left{};
  f64 top_right{};
  f64 bottom_right{};
  f64 bottom_left{};

  RoundedRectRadii() = default;
  RoundedRectRadii(f64 radius) : top_left{radius}, top_right{radius}, bottom_right{radius}, bottom_left{radius} {} // NOLINT(google-explicit-constructor)
  RoundedRectRadii(f64 top_left, f64 top_right, f64 bottom_right, f64 bottom_left)
      : top_left{top_left}, top_right{top_right}, bottom_right{bottom_right}, bottom_left{bottom_left} {}

  bool operator==(const RoundedRectRadii& other) const = default;
};

/**
 * A rectangle with rounded corners. Radii are clamped to half of the shorter side of the rectangle.
 */
class RoundedRect final : public Shape {
  public:
    RoundedRect(const Rect& rect, const RoundedRectRadii& radii);

    [[nodiscard]] const Rect& GetRect() const {
      return m_rect;
    }

    [[nodiscard]] const RoundedRectRadii& GetRadii() const {
      return m_radii;
    }

    [[nodiscard]] BezPath ToPath(f64 tolerance) const override;

    [[nodiscard]] Rect BoundingBox() const override {
      return m_rect;
    }

  private:
    Rect m_rect;
    RoundedRectRadii m_radii;
};

} // namespace multirender
