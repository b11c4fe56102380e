#include <multirender/math/bez_path.hpp>
#include <multirender/math/ellipse.hpp>
#include <multirender/math/line.hpp>
#include <multirender/math/rect.hpp>
#include <multirender/math/rounded_rect.hpp>
#include <algorithm>
#include <cmath>

namespace multirender {

// Distance of the inner control points of a cubic Bézier approximating a quarter circle.
static constexpr f64 k_arc_kappa = 0.5522847498307936;

BezPath Rect::ToPath(f64 tolerance) const {
  BezPath path{};
  path.MoveTo({x0, y0});
  path.LineTo({x1, y0});
  path.LineTo({x1, y1});
  path.LineTo({x0, y1});
  path.ClosePath();
  return path;
}

RoundedRect::RoundedRect(const Rect& rect, const RoundedRectRadii& radii) : m_rect{rect.Abs()} {
  const f64 max_radius = std::min(m_rect.Width(), m_rect.Height()) * 0.5;
  const auto clamp = [&](f64 radius) { return std::clamp(radius, 0.0, max_radius); };

  m_radii = {
    clamp(radii.top_left),
    clamp(radii.top_right),
    clamp(radii.bottom_right),
    clamp(radii.bottom_left)
  };
}

BezPath RoundedRect::ToPath(f64 tolerance) const {
  const f64 x0 = m_rect.x0;
  const f64 y0 = m_rect.y0;
  const f64 x1 = m_rect.x1;
  const f64 y1 = m_rect.y1;
  const f64 k = 1.0 - k_arc_kappa;

  BezPath path{};
  path.MoveTo({x0 + m_radii.top_left, y0});

  path.LineTo({x1 - m_radii.top_right, y0});
  if(m_radii.top_right > 0.0) {
    const f64 r = m_radii.top_right;
    path.CurveTo({x1 - r * k, y0}, {x1, y0 + r * k}, {x1, y0 + r});
  }

  path.LineTo({x1, y1 - m_radii.bottom_right});
  if(m_radii.bottom_right > 0.0) {
    const f64 r = m_radii.bottom_right;
    path.CurveTo({x1, y1 - r * k}, {x1 - r * k, y1}, {x1 - r, y1});
  }

  path.LineTo({x0 + m_radii.bottom_left, y1});
  if(m_radii.bottom_left > 0.0) {
    const f64 r = m_radii.bottom_left;
    path.CurveTo({x0 + r * k, y1}, {x0, y1 - r * k}, {x0, y1 - r});
  }

  path.LineTo({x0, y0 + m_radii.top_left});
  if(m_radii.top_left > 0.0) {
    const f64 r = m_radii.top_left;
    path.CurveTo({x0, y0 + r * k}, {x0 + r * k, y0}, {x0 + r, y0});
  }

  path.ClosePath();
  return path;
}

/// Appends a closed unit circle made of four cubic quarter arcs, mapped through `transform`.
static void append_unit_circle(BezPath& path, const Affine& transform) {
  const f64 k = k_arc_kappa;

  path.MoveTo(transform.Apply({1.0, 0.0}));
  path.CurveTo(transform.Apply({1.0, k}), transform.Apply({k, 1.0}), transform.Apply({0.0, 1.0}));
  path.CurveTo(transform.Apply({-k, 1.0}), transform.Apply({-1.0, k}), transform.Apply({-1.0, 0.0}));
  path.CurveTo(transform.Apply({-1.0, -k}), transform.Apply({-k, -1.0}), transform.Apply({0.0, -1.0}));
  path.CurveTo(transform.Apply({k, -1.0}), transform.Apply({1.0, -k}), transform.Apply({1.0, 0.0}));
  path.ClosePath();
}

BezPath Circle::ToPath(f64 tolerance) const {
  BezPath path{};
  append_unit_circle(path, Affine::Translate(m_center.ToVec2()) * Affine::Scale(m_radius));
  return path;
}

Affine Ellipse::GetUnitCircleTransform() const {
  return Affine::Translate(m_center.ToVec2()) * Affine::Rotate(m_rotation) * Affine::ScaleNonUniform(m_radii.x, m_radii.y);
}

BezPath Ellipse::ToPath(f64 tolerance) const {
  BezPath path{};
  append_unit_circle(path, GetUnitCircleTransform());
  return path;
}

Rect Ellipse::BoundingBox() const {
  const f64 cos = std::cos(m_rotation);
  const f64 sin = std::sin(m_rotation);
  const f64 half_width = std::hypot(m_radii.x * cos, m_radii.y * sin);
  const f64 half_height = std::hypot(m_radii.x * sin, m_radii.y * cos);
  return {m_center.x - half_width, m_center.y - half_height, m_center.x + half_width, m_center.y + half_height};
}

BezPath Line::ToPath(f64 tolerance) const {
  BezPath path{};
  path.MoveTo(m_p0);
  path.LineTo(m_p1);
  return path;
}

} // namespace multirender
