#pragma once

#include <multirender/math/affine.hpp>
#include <multirender/math/rect.hpp>
#include <multirender/math/shape.hpp>
#include <multirender/math/stroke.hpp>
#include <multirender/paint/blend_mode.hpp>
#include <multirender/paint/color.hpp>
#include <multirender/paint/font.hpp>
#include <multirender/paint/image.hpp>
#include <multirender/paint/paint.hpp>
#include <multirender/paint/style.hpp>
#include <multirender/float.hpp>
#include <optional>
#include <span>

namespace multirender {

/**
 * The drawing interface implemented by every backend. Applications describe a frame by calling
 * these methods and the backend decides how (and when) the drawing is executed.
 */
class PaintScene {
  public:
    virtual ~PaintScene() = default;

    /// Removes all content, including any layers that are still pushed.
    virtual void Reset() = 0;

    /**
     * Pushes a new layer. Everything drawn until the matching PopLayer() is composited into the
     * parent layer with the given blend mode, multiplied by `alpha` and clipped to `clip`.
     */
    virtual void PushLayer(const BlendMode& blend, f32 alpha, const Affine& transform, const Shape& clip) = 0;

    /// Pushes a layer that only clips: Normal blending and an alpha of one.
    virtual void PushClipLayer(const Affine& transform, const Shape& clip) = 0;

    /// Pops the most recently pushed layer. Popping without any pushed layer does nothing.
    virtual void PopLayer() = 0;

    /**
     * Strokes the outline of a shape.
     * @param brush_transform maps paint space into shape space; absent means identity.
     */
    virtual void Stroke(const StrokeStyle& style, const Affine& transform, const Paint& paint, const std::optional<Affine>& brush_transform, const Shape& shape) = 0;

    /**
     * Fills the interior of a shape.
     * @param brush_transform maps paint space into shape space; absent means identity.
     */
    virtual void Fill(FillRule style, const Affine& transform, const Paint& paint, const std::optional<Affine>& brush_transform, const Shape& shape) = 0;

    /**
     * Draws a run of glyphs of one font. Each glyph is placed with the transform
     * `transform * Translate(glyph.x, glyph.y) * glyph_transform`.
     */
    virtual void DrawGlyphs(
      const FontData& font,
      f32 font_size,
      bool hint,
      std::span<const NormalizedCoord> normalized_coords,
      const Style& style,
      const Paint& paint,
      f32 brush_alpha,
      const Affine& transform,
      const std::optional<Affine>& glyph_transform,
      std::span<const Glyph> glyphs
    ) = 0;

    /// Draws a rounded rectangle blurred with a Gaussian filter of the given standard deviation.
    virtual void DrawBoxShadow(const Affine& transform, const Rect& rect, const Color& color, f64 radius, f64 std_dev) = 0;

    /// Draws an image at its natural size with the top-left corner at the origin of `transform`.
    virtual void DrawImage(const ImageBrush& image, const Affine& transform);
};

} // namespace multirender
