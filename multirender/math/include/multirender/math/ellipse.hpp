#pragma once

#include <multirender/math/affine.hpp>
#include <multirender/math/point.hpp>
#include <multirender/math/rect.hpp>
#include <multirender/math/shape.hpp>

namespace multirender {

class Circle final : public Shape {
  public:
    Circle(const Point& center, f64 radius) : m_center{center}, m_radius{radius} {}

    [[nodiscard]] const Point& GetCenter() const {
      return m_center;
    }

    [[nodiscard]] f64 GetRadius() const {
      return m_radius;
    }

    [[nodiscard]] BezPath ToPath(f64 tolerance) const override;

    [[nodiscard]] Rect BoundingBox() const override {
      return Rect{m_center.x - m_radius, m_center.y - m_radius, m_center.x + m_radius, m_center.y + m_radius}.Abs();
    }

  private:
    Point m_center;
    f64 m_radius;
};

class Ellipse final : public Shape {
  public:
    /// @param rotation rotation of the x axis of the ellipse in radians
    Ellipse(const Point& center, const Vec2& radii, f64 rotation = 0.0)
        : m_center{center}
        , m_radii{radii}
        , m_rotation{rotation} {
    }

    static Ellipse FromRect(const Rect& rect) {
      const Rect abs = rect.Abs();
      return Ellipse{abs.Center(), {abs.Width() * 0.5, abs.Height() * 0.5}};
    }

    [[nodiscard]] const Point& GetCenter() const {
      return m_center;
    }

    [[nodiscard]] const Vec2& GetRadii() const {
      return m_radii;
    }

    [[nodiscard]] f64 GetRotation() const {
      return m_rotation;
    }

    [[nodiscard]] BezPath ToPath(f64 tolerance) const override;

    [[nodiscard]] Rect BoundingBox() const override;

  private:
    [[nodiscard]] Affine GetUnitCircleTransform() const;

    Point m_center;
    Vec2 m_radii;
    f64 m_rotation;
};

} // namespace multirender
