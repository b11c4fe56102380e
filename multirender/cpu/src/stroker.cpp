#include <multirender/cpu/stroker.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

namespace multirender {

namespace {

constexpr size_t k_max_number_of_dashes = 1'000'000u;

struct Polyline {
  std::vector<Point> points{};
  bool closed{false};
  bool has_segments{false};
};

class Stroker {
  public:
    Stroker(const StrokeStyle& style, f64 tolerance)
        : m_style{style}
        , m_half_width{style.width * 0.5}
        , m_tolerance{tolerance} {
    }

    BezPath Stroke(const BezPath& path) {
      for(const Polyline& polyline : CollectPolylines(path)) {
        if(m_style.dash_pattern.empty()) {
          StrokePolyline(polyline);
        } else {
          for(const Polyline& dash : ApplyDashes(polyline)) {
            StrokePolyline(dash);
          }
        }
      }
      return std::move(m_output);
    }

  private:
    std::vector<Polyline> CollectPolylines(const BezPath& path) const {
      std::vector<Polyline> polylines{};

      path.Flatten(m_tolerance, [&](const PathElement& element) {
        switch(element.kind) {
          case PathElement::Kind::MoveTo: {
            polylines.push_back({.points = {element.points[0]}});
            break;
          }
          case PathElement::Kind::LineTo: {
            if(polylines.empty()) {
              polylines.push_back({.points = {element.points[0]}});
            }
            Polyline& polyline = polylines.back();
            polyline.has_segments = true;
            if(polyline.points.back() != element.points[0]) {
              polyline.points.push_back(element.points[0]);
            }
            break;
          }
          case PathElement::Kind::ClosePath: {
            if(!polylines.empty()) {
              Polyline& polyline = polylines.back();
              polyline.closed = true;
              polyline.has_segments = true;
              if(polyline.points.size() > 1u && polyline.points.back() == polyline.points.front()) {
                polyline.points.pop_back();
              }
            }
            break;
          }
          default: break;
        }
      });

      return polylines;
    }

    std::vector<Polyline> ApplyDashes(const Polyline& polyline) const {
      const std::vector<f64>& pattern = m_style.dash_pattern;

      f64 pattern_length = 0.0;
      for(const f64 dash : pattern) {
        if(dash < 0.0 || !std::isfinite(dash)) {
          return {polyline};
        }
        pattern_length += dash;
      }
      // An odd number of entries is repeated to yield an even number.
      if(pattern.size() % 2u == 1u) {
        pattern_length *= 2.0;
      }
      if(pattern_length <= 0.0) {
        return {polyline};
      }

      std::vector<Point> points = polyline.points;
      if(polyline.closed && points.size() > 1u) {
        points.push_back(points.front());
      }

      f64 path_length = 0.0;
      for(size_t i = 1; i < points.size(); i++) {
        path_length += points[i - 1].Distance(points[i]);
      }
      if(path_length / pattern_length > (f64)k_max_number_of_dashes) {
        return {polyline};
      }

      const size_t pattern_size = pattern.size() % 2u == 1u ? pattern.size() * 2u : pattern.size();
      const auto dash_length = [&](size_t index) {
        return pattern[index % pattern.size()];
      };

      f64 offset = std::fmod(m_style.dash_offset, pattern_length);
      if(offset < 0.0) {
        offset += pattern_length;
      }

      size_t index = 0u;
      while(offset >= dash_length(index) && offset > 0.0) {
        offset -= dash_length(index);
        index = (index + 1u) % pattern_size;
      }

      f64 remaining = dash_length(index) - offset;
      bool on = index % 2u == 0u;

      std::vector<Polyline> dashes{};
      Polyline current{};

      const auto emit = [&]() {
        if(current.points.size() > 1u || (current.has_segments && !current.points.empty())) {
          dashes.push_back(std::move(current));
        }
        current = {};
      };

      if(on && !points.empty()) {
        current.points.push_back(points.front());
      }

      for(size_t i = 1; i < points.size(); i++) {
        const Point& a = points[i - 1];
        const Point& b = points[i];
        const f64 length = a.Distance(b);
        f64 position = 0.0;

        while(length - position > remaining) {
          position += remaining;
          const Point split = a.Lerp(b, position / length);

          if(on) {
            if(current.points.back() != split) {
              current.points.push_back(split);
            }
            current.has_segments = true;
            emit();
          } else {
            current.points = {split};
          }

          on = !on;
          index = (index + 1u) % pattern_size;
          remaining = dash_length(index);
        }

        remaining -= length - position;
        if(on) {
          current.has_segments = true;
          if(current.points.empty() || current.points.back() != b) {
            current.points.push_back(b);
          }
        }
      }

      if(on) {
        emit();
      }
      return dashes;
    }

    void StrokePolyline(const Polyline& polyline) {
      const std::vector<Point>& points = polyline.points;

      if(points.size() == 1u) {
        if(polyline.has_segments) {
          StrokeDot(points[0]);
        }
        return;
      }

      const size_t number_of_segments = polyline.closed ? points.size() : points.size() - 1u;

      for(size_t i = 0; i < number_of_segments; i++) {
        const Point& a = points[i];
        const Point& b = points[(i + 1u) % points.size()];
        const Vec2 normal = (b - a).Normalized().Perpendicular() * m_half_width;
        EmitPolygon({a + normal, b + normal, b - normal, a - normal});
      }

      if(polyline.closed) {
        for(size_t i = 0; i < points.size(); i++) {
          const Point& prev = points[(i + points.size() - 1u) % points.size()];
          const Point& next = points[(i + 1u) % points.size()];
          EmitJoin(points[i], (points[i] - prev).Normalized(), (next - points[i]).Normalized());
        }
      } else {
        for(size_t i = 1; i + 1u < points.size(); i++) {
          EmitJoin(points[i], (points[i] - points[i - 1]).Normalized(), (points[i + 1] - points[i]).Normalized());
        }
        EmitCap(points.front(), (points[0] - points[1]).Normalized(), m_style.start_cap);
        EmitCap(points.back(), (points[points.size() - 1u] - points[points.size() - 2u]).Normalized(), m_style.end_cap);
      }
    }

    /// Zero length subpaths only show their caps.
    void StrokeDot(const Point& point) {
      switch(m_style.start_cap) {
        case Cap::Butt: {
          break;
        }
        case Cap::Square: {
          const Vec2 offset{m_half_width, m_half_width};
          EmitPolygon({
            point - offset,
            point + Vec2{m_half_width, -m_half_width},
            point + offset,
            point + Vec2{-m_half_width, m_half_width}
          });
          break;
        }
        case Cap::Round: {
          EmitCircle(point);
          break;
        }
      }
    }

    void EmitJoin(const Point& point, const Vec2& d0, const Vec2& d1) {
      const f64 cross = d0.Cross(d1);
      const f64 dot = d0.Dot(d1);

      if(std::abs(cross) < 1e-12) {
        if(dot < 0.0 && m_style.join == Join::Round) {
          EmitCircle(point);
        }
        return;
      }

      // The offset outlines separate on the side facing away from the turn.
      const f64 side = cross > 0.0 ? -1.0 : 1.0;
      const Vec2 n0 = d0.Perpendicular() * side;
      const Vec2 n1 = d1.Perpendicular() * side;
      const Point a = point + n0 * m_half_width;
      const Point b = point + n1 * m_half_width;

      switch(m_style.join) {
        case Join::Bevel: {
          EmitPolygon({point, a, b});
          break;
        }
        case Join::Miter: {
          const f64 cos_half_turn = std::sqrt(std::max(0.0, (1.0 + dot) * 0.5));
          if(cos_half_turn > 0.0 && 1.0 / cos_half_turn <= m_style.miter_limit) {
            const Vec2 bisector = (n0 + n1).Normalized();
            const Point tip = point + bisector * (m_half_width / cos_half_turn);
            EmitPolygon({point, a, tip, b});
          } else {
            EmitPolygon({point, a, b});
          }
          break;
        }
        case Join::Round: {
          std::vector<Point> fan{point};
          AppendArc(fan, point, n0, std::atan2(n0.Cross(n1), n0.Dot(n1)));
          EmitPolygon(fan);
          break;
        }
      }
    }

    /// @param direction unit vector pointing away from the stroke
    void EmitCap(const Point& point, const Vec2& direction, Cap cap) {
      const Vec2 normal = direction.Perpendicular() * m_half_width;

      switch(cap) {
        case Cap::Butt: {
          break;
        }
        case Cap::Square: {
          const Vec2 extent = direction * m_half_width;
          EmitPolygon({point + normal, point + normal + extent, point - normal + extent, point - normal});
          break;
        }
        case Cap::Round: {
          std::vector<Point> half_disc{};
          AppendArc(half_disc, point, direction.Perpendicular(), -std::numbers::pi);
          EmitPolygon(half_disc);
          break;
        }
      }
    }

    void EmitCircle(const Point& center) {
      std::vector<Point> circle{};
      AppendArc(circle, center, {1.0, 0.0}, 2.0 * std::numbers::pi);
      circle.pop_back();
      EmitPolygon(circle);
    }

    /// Appends points on the arc of radius half width around `center`, starting at unit vector `start`.
    void AppendArc(std::vector<Point>& points, const Point& center, const Vec2& start, f64 sweep) const {
      f64 step = std::numbers::pi * 0.5;
      if(m_tolerance < m_half_width) {
        step = std::min(step, 2.0 * std::acos(1.0 - m_tolerance / m_half_width));
      }

      const int number_of_steps = std::max(1, (int)std::ceil(std::abs(sweep) / step));
      const f64 start_angle = std::atan2(start.y, start.x);

      for(int i = 0; i <= number_of_steps; i++) {
        const f64 angle = start_angle + sweep * (f64)i / (f64)number_of_steps;
        points.push_back(center + Vec2{std::cos(angle), std::sin(angle)} * m_half_width);
      }
    }

    /// Emits a closed polygon, reversing it if needed so that every polygon winds the same way.
    void EmitPolygon(const std::vector<Point>& polygon) {
      if(polygon.size() < 3u) {
        return;
      }

      f64 signed_area = 0.0;
      for(size_t i = 0; i < polygon.size(); i++) {
        signed_area += polygon[i].ToVec2().Cross(polygon[(i + 1u) % polygon.size()].ToVec2());
      }

      if(signed_area >= 0.0) {
        m_output.MoveTo(polygon[0]);
        for(size_t i = 1; i < polygon.size(); i++) {
          m_output.LineTo(polygon[i]);
        }
      } else {
        m_output.MoveTo(polygon.back());
        for(size_t i = polygon.size() - 1u; i-- > 0u;) {
          m_output.LineTo(polygon[i]);
        }
      }
      m_output.ClosePath();
    }

    const StrokeStyle& m_style;
    f64 m_half_width;
    f64 m_tolerance;
    BezPath m_output{};
};

} // anonymous namespace

BezPath stroke_to_fill_path(const BezPath& path, const StrokeStyle& style, f64 tolerance) {
  if(!(style.width > 0.0) || !std::isfinite(style.width)) {
    return {};
  }
  return Stroker{style, tolerance}.Stroke(path);
}

} // namespace multirender
