#include <multirender/cpu/paint_shader.hpp>
#include <cmath>
#include <optional>
#include <numbers>
#include <type_traits>
#include <variant>

namespace multirender {

PaintShader::PaintShader(const Paint& paint, const Affine& paint_transform, ImageCache& image_cache, f32 alpha)
    : m_device_to_paint{paint_transform.Inverse()}
    , m_alpha{alpha} {
  const bool invertible = paint_transform.Determinant() != 0.0 && paint_transform.IsFinite();

  std::visit([&](const auto& value) {
    using T = std::decay_t<decltype(value)>;

    if constexpr(std::is_same_v<T, Color>) {
      m_kind = Kind::Solid;
      m_solid = value.MultiplyAlpha(alpha).Premultiply();
      if(m_solid.a <= 0.0f) {
        m_kind = Kind::Transparent;
      }
    } else if constexpr(std::is_same_v<T, Gradient>) {
      if(!invertible || value.GetStops().empty()) {
        return;
      }
      if(value.GetStops().size() == 1u) {
        m_kind = Kind::Solid;
        m_solid = value.GetStops()[0].color.MultiplyAlpha(alpha).Premultiply();
        return;
      }
      m_kind = Kind::Gradient;
      m_gradient = &value;
    } else if constexpr(std::is_same_v<T, ImageBrush>) {
      if(!invertible) {
        return;
      }
      m_image = image_cache.GetPixmap(value.image);
      if(m_image != nullptr) {
        m_kind = Kind::Image;
        m_sampler = value.sampler;
        m_alpha *= value.sampler.alpha;
      }
    } else if constexpr(std::is_same_v<T, CustomPaint>) {
      // Custom paints have no source on the CPU.
      m_kind = Kind::Transparent;
    }
  }, paint);
}

void PaintShader::ShadeSpan(i32 x, i32 y, std::span<PremulColor> out) const {
  if(IsSolid()) {
    const PremulColor color = IsTransparent() ? PremulColor{} : m_solid;
    for(PremulColor& pixel : out) {
      pixel = color;
    }
    return;
  }

  for(size_t i = 0; i < out.size(); i++) {
    out[i] = Shade({(f64)x + (f64)i + 0.5, (f64)y + 0.5});
  }
}

PremulColor PaintShader::Shade(const Point& device_point) const {
  switch(m_kind) {
    case Kind::Transparent: return {};
    case Kind::Solid:       return m_solid;
    case Kind::Gradient:    return ShadeGradient(m_device_to_paint.Apply(device_point));
    case Kind::Image:       return ShadeImage(m_device_to_paint.Apply(device_point));
  }
  return {};
}

PremulColor PaintShader::ShadeGradient(const Point& p) const {
  std::optional<f64> t{};

  std::visit([&](const auto& position) {
    using T = std::decay_t<decltype(position)>;

    if constexpr(std::is_same_v<T, LinearGradientPosition>) {
      const Vec2 direction = position.end - position.start;
      const f64 length_squared = direction.Dot(direction);
      if(length_squared > 0.0) {
        t = (p - position.start).Dot(direction) / length_squared;
      }
    } else if constexpr(std::is_same_v<T, RadialGradientPosition>) {
      // Find the largest t for which p lies on the circle interpolated between the start and end circles.
      const Vec2 cd = position.end_center - position.start_center;
      const Vec2 pd = p - position.start_center;
      const f64 r0 = position.start_radius;
      const f64 dr = (f64)position.end_radius - r0;

      const f64 a = cd.Dot(cd) - dr * dr;
      const f64 b = pd.Dot(cd) + r0 * dr;
      const f64 c = pd.Dot(pd) - r0 * r0;

      const auto radius_at = [&](f64 value) { return r0 + value * dr; };

      if(std::abs(a) < 1e-12) {
        if(b != 0.0) {
          const f64 candidate = c / (2.0 * b);
          if(radius_at(candidate) >= 0.0) {
            t = candidate;
          }
        }
      } else {
        const f64 discriminant = b * b - a * c;
        if(discriminant >= 0.0) {
          const f64 root = std::sqrt(discriminant);
          const f64 t0 = (b + root) / a;
          const f64 t1 = (b - root) / a;
          const f64 t_max = std::max(t0, t1);
          const f64 t_min = std::min(t0, t1);
          if(radius_at(t_max) >= 0.0) {
            t = t_max;
          } else if(radius_at(t_min) >= 0.0) {
            t = t_min;
          }
        }
      }
    } else if constexpr(std::is_same_v<T, SweepGradientPosition>) {
      const f64 sweep = (f64)position.end_angle - (f64)position.start_angle;
      if(sweep != 0.0) {
        f64 angle = std::atan2(p.y - position.center.y, p.x - position.center.x);
        if(angle < 0.0) {
          angle += 2.0 * std::numbers::pi;
        }
        t = (angle - (f64)position.start_angle) / sweep;
      }
    }
  }, m_gradient->GetKind());

  if(!t.has_value() || !std::isfinite(*t)) {
    return {};
  }

  const f32 extended = apply_extend((f32)*t, m_gradient->GetExtend());
  return m_gradient->Evaluate(extended).MultiplyAlpha(m_alpha).Premultiply();
}

PremulColor PaintShader::ShadeImage(const Point& p) const {
  return m_image->Sample(p.x, p.y, m_sampler.x_extend, m_sampler.y_extend, m_sampler.quality) * m_alpha;
}

} // namespace multirender
