#include <multirender/math/affine.hpp>
#include <multirender/math/rect.hpp>
#include <algorithm>
#include <cmath>

namespace multirender {

Affine Affine::Rotate(f64 angle) {
  const f64 sin = std::sin(angle);
  const f64 cos = std::cos(angle);
  return Affine{{cos, sin, -sin, cos, 0.0, 0.0}};
}

Affine Affine::RotateAbout(f64 angle, const Point& center) {
  const Vec2 offset = center.ToVec2();
  return Translate(offset) * Rotate(angle) * Translate(-offset);
}

Affine Affine::Inverse() const {
  const auto& [a, b, c, d, e, f] = m_coefficients;
  const f64 det = Determinant();

  if(det == 0.0) {
    return Affine{{0.0, 0.0, 0.0, 0.0, 0.0, 0.0}};
  }

  const f64 inv_det = 1.0 / det;
  return Affine{{
    d * inv_det,
   -b * inv_det,
   -c * inv_det,
    a * inv_det,
    (c * f - d * e) * inv_det,
    (b * e - a * f) * inv_det
  }};
}

Rect Affine::TransformRectBoundingBox(const Rect& rect) const {
  const Point corners[4] {
    Apply({rect.x0, rect.y0}),
    Apply({rect.x1, rect.y0}),
    Apply({rect.x1, rect.y1}),
    Apply({rect.x0, rect.y1})
  };

  Rect bounds{corners[0].x, corners[0].y, corners[0].x, corners[0].y};
  for(const Point& corner : corners) {
    bounds.x0 = std::min(bounds.x0, corner.x);
    bounds.y0 = std::min(bounds.y0, corner.y);
    bounds.x1 = std::max(bounds.x1, corner.x);
    bounds.y1 = std::max(bounds.y1, corner.y);
  }
  return bounds;
}

bool Affine::IsFinite() const {
  return std::ranges::all_of(m_coefficients, [](f64 coefficient) { return std::isfinite(coefficient); });
}

Affine Affine::operator*(const Affine& other) const {
  const auto& lhs = m_coefficients;
  const auto& rhs = other.m_coefficients;

  return Affine{{
    lhs[0] * rhs[0] + lhs[2] * rhs[1],
    lhs[1] * rhs[0] + lhs[3] * rhs[1],
    lhs[0] * rhs[2] + lhs[2] * rhs[3],
    lhs[1] * rhs[2] + lhs[3] * rhs[3],
    lhs[0] * rhs[4] + lhs[2] * rhs[5] + lhs[4],
    lhs[1] * rhs[4] + lhs[3] * rhs[5] + lhs[5]
  }};
}

} // namespace multirender
