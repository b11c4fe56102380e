#include <multirender/math/bez_path.hpp>
#include <algorithm>
#include <cmath>

namespace multirender {

// Upper bound of line segments emitted per curve, protects against absurd tolerances.
static constexpr f64 k_max_subdivisions = 4096.0;

void BezPath::MoveTo(const Point& p) {
  m_elements.push_back({.kind = PathElement::Kind::MoveTo, .points = {p}});
}

void BezPath::LineTo(const Point& p) {
  if(m_elements.empty()) {
    MoveTo(p);
    return;
  }
  m_elements.push_back({.kind = PathElement::Kind::LineTo, .points = {p}});
}

void BezPath::QuadTo(const Point& p1, const Point& p2) {
  if(m_elements.empty()) {
    MoveTo(p1);
  }
  m_elements.push_back({.kind = PathElement::Kind::QuadTo, .points = {p1, p2}});
}

void BezPath::CurveTo(const Point& p1, const Point& p2, const Point& p3) {
  if(m_elements.empty()) {
    MoveTo(p1);
  }
  m_elements.push_back({.kind = PathElement::Kind::CurveTo, .points = {p1, p2, p3}});
}

void BezPath::ClosePath() {
  if(m_elements.empty()) {
    return;
  }
  m_elements.push_back({.kind = PathElement::Kind::ClosePath});
}

void BezPath::ApplyAffine(const Affine& affine) {
  for(PathElement& element : m_elements) {
    const size_t number_of_points = PathElement::GetNumberOfPoints(element.kind);
    for(size_t i = 0; i < number_of_points; i++) {
      element.points[i] = affine.Apply(element.points[i]);
    }
  }
}

void BezPath::Flatten(f64 tolerance, const std::function<void(const PathElement&)>& callback) const {
  tolerance = std::max(tolerance, 1e-6);

  Point start_point{};
  Point current_point{};

  const auto emit_line_to = [&](const Point& p) {
    callback({.kind = PathElement::Kind::LineTo, .points = {p}});
  };

  // Wang's formula: the number of segments needed so that a degree n curve deviates at most
  // `tolerance` from its polyline is sqrt(n * (n - 1) / 8 * max_second_difference / tolerance).
  const auto get_number_of_subdivisions = [&](f64 max_second_difference, f64 degree_factor) {
    const f64 segments = std::ceil(std::sqrt(degree_factor * max_second_difference / tolerance));
    if(!std::isfinite(segments)) {
      return std::isnan(segments) ? 1 : (int)k_max_subdivisions;
    }
    return (int)std::clamp(segments, 1.0, k_max_subdivisions);
  };

  for(const PathElement& element : m_elements) {
    switch(element.kind) {
      case PathElement::Kind::MoveTo: {
        start_point = element.points[0];
        current_point = start_point;
        callback(element);
        break;
      }
      case PathElement::Kind::LineTo: {
        current_point = element.points[0];
        callback(element);
        break;
      }
      case PathElement::Kind::QuadTo: {
        const Point& p0 = current_point;
        const Point& p1 = element.points[0];
        const Point& p2 = element.points[1];
        const f64 dd = Vec2{p0.x - 2.0 * p1.x + p2.x, p0.y - 2.0 * p1.y + p2.y}.Length();
        const int n = get_number_of_subdivisions(dd, 0.25);

        for(int i = 1; i < n; i++) {
          const f64 t = (f64)i / (f64)n;
          const f64 mt = 1.0 - t;
          emit_line_to({
            mt * mt * p0.x + 2.0 * mt * t * p1.x + t * t * p2.x,
            mt * mt * p0.y + 2.0 * mt * t * p1.y + t * t * p2.y
          });
        }
        emit_line_to(p2);
        current_point = p2;
        break;
      }
      case PathElement::Kind::CurveTo: {
        const Point& p0 = current_point;
        const Point& p1 = element.points[0];
        const Point& p2 = element.points[1];
        const Point& p3 = element.points[2];
        const f64 dd = std::max(
          Vec2{p0.x - 2.0 * p1.x + p2.x, p0.y - 2.0 * p1.y + p2.y}.Length(),
          Vec2{p1.x - 2.0 * p2.x + p3.x, p1.y - 2.0 * p2.y + p3.y}.Length());
        const int n = get_number_of_subdivisions(dd, 0.75);

        for(int i = 1; i < n; i++) {
          const f64 t = (f64)i / (f64)n;
          const f64 mt = 1.0 - t;
          const f64 w0 = mt * mt * mt;
          const f64 w1 = 3.0 * mt * mt * t;
          const f64 w2 = 3.0 * mt * t * t;
          const f64 w3 = t * t * t;
          emit_line_to({
            w0 * p0.x + w1 * p1.x + w2 * p2.x + w3 * p3.x,
            w0 * p0.y + w1 * p1.y + w2 * p2.y + w3 * p3.y
          });
        }
        emit_line_to(p3);
        current_point = p3;
        break;
      }
      case PathElement::Kind::ClosePath: {
        callback(element);
        current_point = start_point;
        break;
      }
    }
  }
}

Rect BezPath::BoundingBox() const {
  bool first = true;
  Rect bounds{};

  for(const PathElement& element : m_elements) {
    const size_t number_of_points = PathElement::GetNumberOfPoints(element.kind);
    for(size_t i = 0; i < number_of_points; i++) {
      const Point& p = element.points[i];
      if(first) {
        bounds = Rect{p.x, p.y, p.x, p.y};
        first = false;
      } else {
        bounds.x0 = std::min(bounds.x0, p.x);
        bounds.y0 = std::min(bounds.y0, p.y);
        bounds.x1 = std::max(bounds.x1, p.x);
        bounds.y1 = std::max(bounds.y1, p.y);
      }
    }
  }

  return bounds;
}

} // namespace multirender
