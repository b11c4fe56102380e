#pragma once

#include <multirender/math/point.hpp>
#include <multirender/math/rect.hpp>
#include <multirender/math/shape.hpp>

namespace multirender {

class Line final : public Shape {
  public:
    Line(const Point& p0, const Point& p1) : m_p0{p0}, m_p1{p1} {}

    [[nodiscard]] const Point& GetP0() const { return m_p0; }
    [[nodiscard]] const Point& GetP1() const { return m_p1; }

    [[nodiscard]] f64 Length() const {
      return m_p0.Distance(m_p1);
    }

    [[nodiscard]] BezPath ToPath(f64 tolerance) const override;

    [[nodiscard]] Rect BoundingBox() const override {
      return Rect::FromPoints(m_p0, m_p1);
    }

  private:
    Point m_p0;
    Point m_p1;
};

} // namespace multirender
