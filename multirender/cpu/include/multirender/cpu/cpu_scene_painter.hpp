#pragma once

#include <multirender/cpu/glyph_outline_provider.hpp>
#include <multirender/cpu/image_cache.hpp>
#include <multirender/cpu/mask.hpp>
#include <multirender/cpu/paint_shader.hpp>
#include <multirender/cpu/pixmap.hpp>
#include <multirender/cpu/rasterizer.hpp>
#include <multirender/math/shape.hpp>
#include <multirender/paint_scene.hpp>
#include <multirender/float.hpp>
#include <multirender/integer.hpp>
#include <vector>

namespace multirender {

/**
 * A PaintScene that rasterizes every command immediately into a premultiplied pixmap.
 */
class CpuScenePainter final : public PaintScene {
  public:
    CpuScenePainter(u32 width, u32 height, ImageCache& image_cache, f64 tolerance = k_default_tolerance);

    void Resize(u32 width, u32 height);

    void SetGlyphOutlineProvider(GlyphOutlineProvider* provider) {
      m_glyph_outline_provider = provider;
    }

    void Reset() override;
    void PushLayer(const BlendMode& blend, f32 alpha, const Affine& transform, const Shape& clip) override;
    void PushClipLayer(const Affine& transform, const Shape& clip) override;
    void PopLayer() override;
    void Stroke(const StrokeStyle& style, const Affine& transform, const Paint& paint, const std::optional<Affine>& brush_transform, const Shape& shape) override;
    void Fill(FillRule style, const Affine& transform, const Paint& paint, const std::optional<Affine>& brush_transform, const Shape& shape) override;
    void DrawGlyphs(
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
    ) override;
    void DrawBoxShadow(const Affine& transform, const Rect& rect, const Color& color, f64 radius, f64 std_dev) override;

    /// Composites all layers that are still pushed, leaving the final image in GetPixmap().
    void Finish();

    [[nodiscard]] const Pixmap& GetPixmap() const {
      return m_base;
    }

    [[nodiscard]] size_t GetLayerDepth() const {
      return m_layer_depth;
    }

  private:
    enum class LayerKind {
      Layer,
      Clip
    };

    struct Layer {
      LayerKind kind{LayerKind::Layer};
      BlendMode blend{};
      f32 alpha{1.0f};
      Pixmap pixmap{};
      Mask clip{};
    };

    void PushLayerImpl(LayerKind kind, const BlendMode& blend, f32 alpha, const Affine& transform, const Shape& clip);
    void FillPath(const BezPath& path, const Affine& transform, FillRule fill_rule, const PaintShader& shader);
    void StrokePath(const BezPath& path, const StrokeStyle& style, const Affine& transform, const PaintShader& shader);
    void FillMask(const Mask& mask, const PaintShader& shader);
    void ComposeLayer(const Layer& layer, Pixmap& target) const;
    Pixmap& GetTarget();

    [[nodiscard]] PixelBounds GetFullBounds() const {
      return {0, 0, (i32)m_width, (i32)m_height};
    }

    u32 m_width;
    u32 m_height;
    f64 m_tolerance;
    ImageCache& m_image_cache;
    GlyphOutlineProvider* m_glyph_outline_provider{};
    bool m_reported_missing_glyph_outline_provider{false};

    Pixmap m_base{};
    std::vector<Layer> m_layers{}; //< entries beyond m_layer_depth are kept for reuse
    size_t m_layer_depth{0u};

    Rasterizer m_rasterizer{};
    Mask m_mask{};
    std::vector<PremulColor> m_span{};
};

} // namespace multirender
