#pragma once

#include <multirender/cpu/image_cache.hpp>
#include <multirender/cpu/pixmap.hpp>
#include <multirender/math/affine.hpp>
#include <multirender/paint/color.hpp>
#include <multirender/paint/paint.hpp>
#include <multirender/float.hpp>
#include <multirender/integer.hpp>
#include <span>

namespace multirender {

/**
 * Evaluates a paint at device pixel positions. `paint_transform` maps paint space into device space.
 * The shader references the paint and the cached image pixmap, so it must not outlive either.
 */
class PaintShader {
  public:
    PaintShader(const Paint& paint, const Affine& paint_transform, ImageCache& image_cache, f32 alpha = 1.0f);

    /// @returns true if the shader produces the same color for every pixel
    [[nodiscard]] bool IsSolid() const {
      return m_kind == Kind::Solid || m_kind == Kind::Transparent;
    }

    /// @returns true if the shader never produces a visible color
    [[nodiscard]] bool IsTransparent() const {
      return m_kind == Kind::Transparent;
    }

    /// Shades the pixel centers of `out.size()` pixels, starting at pixel (x, y).
    void ShadeSpan(i32 x, i32 y, std::span<PremulColor> out) const;

    /// Shades a single position given in device space.
    [[nodiscard]] PremulColor Shade(const Point& device_point) const;

  private:
    enum class Kind {
      Transparent,
      Solid,
      Gradient,
      Image
    };

    [[nodiscard]] PremulColor ShadeGradient(const Point& p) const;
    [[nodiscard]] PremulColor ShadeImage(const Point& p) const;

    Kind m_kind{Kind::Transparent};
    PremulColor m_solid{};
    Affine m_device_to_paint{};
    f32 m_alpha{1.0f};
    const Gradient* m_gradient{};
    const Pixmap* m_image{};
    ImageSampler m_sampler{};
};

} // namespace multirender
