#include <multirender/cpu/blend.hpp>
#include <multirender/cpu/box_shadow.hpp>
#include <multirender/cpu/cpu_scene_painter.hpp>
#include <multirender/cpu/stroker.hpp>
#include <multirender/logger/logger.hpp>
#include <multirender/math/rounded_rect.hpp>
#include <algorithm>
#include <cmath>
#include <type_traits>
#include <variant>

namespace multirender {

CpuScenePainter::CpuScenePainter(u32 width, u32 height, ImageCache& image_cache, f64 tolerance)
    : m_width{width}
    , m_height{height}
    , m_tolerance{tolerance}
    , m_image_cache{image_cache} {
  Resize(width, height);
}

void CpuScenePainter::Resize(u32 width, u32 height) {
  m_width = width;
  m_height = height;
  m_base.Resize(width, height);
  m_rasterizer.Resize(width, height);
  m_mask.Resize(width, height);
  m_layers.clear();
  m_layer_depth = 0u;
}

void CpuScenePainter::Reset() {
  m_base.Clear();
  m_layer_depth = 0u;
}

void CpuScenePainter::PushLayer(const BlendMode& blend, f32 alpha, const Affine& transform, const Shape& clip) {
  PushLayerImpl(LayerKind::Layer, blend, alpha, transform, clip);
}

void CpuScenePainter::PushClipLayer(const Affine& transform, const Shape& clip) {
  PushLayerImpl(LayerKind::Clip, BlendMode{}, 1.0f, transform, clip);
}

void CpuScenePainter::PushLayerImpl(LayerKind kind, const BlendMode& blend, f32 alpha, const Affine& transform, const Shape& clip) {
  if(m_layers.size() <= m_layer_depth) {
    m_layers.emplace_back();
  }

  Layer& layer = m_layers[m_layer_depth];
  layer.kind = kind;
  layer.blend = blend;
  layer.alpha = alpha;

  if(layer.pixmap.GetWidth() != m_width || layer.pixmap.GetHeight() != m_height) {
    layer.pixmap.Resize(m_width, m_height);
  } else {
    layer.pixmap.Clear();
  }

  m_rasterizer.Reset();
  m_rasterizer.AddPath(clip.ToPath(m_tolerance), transform, m_tolerance);
  m_rasterizer.Rasterize(FillRule::NonZero, layer.clip);

  m_layer_depth++;
}

void CpuScenePainter::PopLayer() {
  if(m_layer_depth == 0u) {
    return;
  }

  m_layer_depth--;
  ComposeLayer(m_layers[m_layer_depth], GetTarget());
}

void CpuScenePainter::Finish() {
  if(m_layer_depth > 0u) {
    MULTIRENDER_DEBUG("CpuScenePainter: compositing {} layer(s) that were not popped", m_layer_depth);
  }

  while(m_layer_depth > 0u) {
    PopLayer();
  }
}

void CpuScenePainter::Stroke(const StrokeStyle& style, const Affine& transform, const Paint& paint, const std::optional<Affine>& brush_transform, const Shape& shape) {
  const PaintShader shader{paint, transform * brush_transform.value_or(Affine::Identity()), m_image_cache};
  if(shader.IsTransparent()) {
    return;
  }

  const f64 scale = std::sqrt(std::abs(transform.Determinant()));
  if(!(scale > 0.0) || !std::isfinite(scale)) {
    return;
  }

  StrokePath(shape.ToPath(m_tolerance / scale), style, transform, shader);
}

void CpuScenePainter::Fill(FillRule style, const Affine& transform, const Paint& paint, const std::optional<Affine>& brush_transform, const Shape& shape) {
  const PaintShader shader{paint, transform * brush_transform.value_or(Affine::Identity()), m_image_cache};
  if(shader.IsTransparent()) {
    return;
  }

  FillPath(shape.ToPath(m_tolerance), transform, style, shader);
}

void CpuScenePainter::DrawGlyphs(
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
) {
  if(glyphs.empty()) {
    return;
  }

  if(m_glyph_outline_provider == nullptr) {
    if(!m_reported_missing_glyph_outline_provider) {
      MULTIRENDER_DEBUG("CpuScenePainter: no glyph outline provider installed, glyph runs will be skipped");
      m_reported_missing_glyph_outline_provider = true;
    }
    return;
  }

  const PaintShader shader{paint, transform, m_image_cache, brush_alpha};
  if(shader.IsTransparent()) {
    return;
  }

  const Affine per_glyph_transform = glyph_transform.value_or(Affine::Identity());

  for(const Glyph& glyph : glyphs) {
    const std::optional<BezPath> outline = m_glyph_outline_provider->GetGlyphOutline(font, glyph.id, font_size, hint, normalized_coords);
    if(!outline.has_value()) {
      continue;
    }

    const Affine glyph_affine = transform * Affine::Translate({(f64)glyph.x, (f64)glyph.y}) * per_glyph_transform;

    if(const auto* fill_rule = std::get_if<FillRule>(&style)) {
      FillPath(*outline, glyph_affine, *fill_rule, shader);
    } else {
      StrokePath(*outline, std::get<StrokeStyle>(style), glyph_affine, shader);
    }
  }
}

void CpuScenePainter::DrawBoxShadow(const Affine& transform, const Rect& rect, const Color& color, f64 radius, f64 std_dev) {
  const PaintShader shader{color, transform, m_image_cache};
  if(shader.IsTransparent()) {
    return;
  }

  if(!(std_dev > 0.0)) {
    FillPath(RoundedRect{rect.Abs(), radius}.ToPath(m_tolerance), transform, FillRule::NonZero, shader);
    return;
  }

  if(transform.Determinant() == 0.0 || !transform.IsFinite()) {
    return;
  }

  const Affine inverse = transform.Inverse();
  const Rect device_rect = transform.TransformRectBoundingBox(rect.Abs().Inflate(3.0 * std_dev, 3.0 * std_dev));

  const PixelBounds bounds = PixelBounds{
    (i32)std::clamp(std::floor(device_rect.x0), 0.0, (f64)m_width),
    (i32)std::clamp(std::floor(device_rect.y0), 0.0, (f64)m_height),
    (i32)std::clamp(std::ceil(device_rect.x1), 0.0, (f64)m_width),
    (i32)std::clamp(std::ceil(device_rect.y1), 0.0, (f64)m_height)
  };

  m_mask.Clear();
  if(bounds.IsEmpty()) {
    return;
  }

  for(i32 y = bounds.y0; y < bounds.y1; y++) {
    const std::span<f32> row = m_mask.Row((u32)y);
    for(i32 x = bounds.x0; x < bounds.x1; x++) {
      const Point local = inverse.Apply({(f64)x + 0.5, (f64)y + 0.5});
      row[x] = evaluate_box_shadow(local, rect, radius, std_dev);
    }
  }
  m_mask.SetBounds(bounds);

  FillMask(m_mask, shader);
}

void CpuScenePainter::FillPath(const BezPath& path, const Affine& transform, FillRule fill_rule, const PaintShader& shader) {
  m_rasterizer.Reset();
  m_rasterizer.AddPath(path, transform, m_tolerance);
  m_rasterizer.Rasterize(fill_rule, m_mask);
  FillMask(m_mask, shader);
}

void CpuScenePainter::StrokePath(const BezPath& path, const StrokeStyle& style, const Affine& transform, const PaintShader& shader) {
  const f64 scale = std::sqrt(std::abs(transform.Determinant()));
  if(!(scale > 0.0) || !std::isfinite(scale)) {
    return;
  }

  // The stroke is built in user space, so the tolerance has to be scaled down accordingly.
  const BezPath outline = stroke_to_fill_path(path, style, m_tolerance / scale);
  FillPath(outline, transform, FillRule::NonZero, shader);
}

void CpuScenePainter::FillMask(const Mask& mask, const PaintShader& shader) {
  const PixelBounds bounds = mask.GetBounds().Intersect(GetFullBounds());
  if(bounds.IsEmpty()) {
    return;
  }

  Pixmap& target = GetTarget();
  m_span.resize((size_t)(bounds.x1 - bounds.x0));

  for(i32 y = bounds.y0; y < bounds.y1; y++) {
    const std::span<const f32> coverage = mask.Row((u32)y);
    const std::span<PremulColor> pixels = target.Row((u32)y);

    shader.ShadeSpan(bounds.x0, y, m_span);

    for(i32 x = bounds.x0; x < bounds.x1; x++) {
      const f32 alpha = coverage[x];
      if(alpha <= 0.0f) {
        continue;
      }
      pixels[x] = blend_src_over(m_span[x - bounds.x0] * alpha, pixels[x]);
    }
  }
}

void CpuScenePainter::ComposeLayer(const Layer& layer, Pixmap& target) const {
  const PixelBounds bounds = layer.clip.GetBounds().Intersect(GetFullBounds());
  const bool src_over = layer.kind == LayerKind::Clip ||
    (layer.blend.compose == Compose::SrcOver && (layer.blend.mix == Mix::Normal || layer.blend.mix == Mix::Clip));

  for(i32 y = bounds.y0; y < bounds.y1; y++) {
    const std::span<const f32> coverage = layer.clip.Row((u32)y);
    const std::span<const PremulColor> src_pixels = layer.pixmap.Row((u32)y);
    const std::span<PremulColor> dst_pixels = target.Row((u32)y);

    for(i32 x = bounds.x0; x < bounds.x1; x++) {
      const f32 clip = coverage[x];
      if(clip <= 0.0f) {
        continue;
      }

      const PremulColor src = src_pixels[x] * layer.alpha;
      const PremulColor dst = dst_pixels[x];

      if(src_over) {
        dst_pixels[x] = blend_src_over(src * clip, dst);
      } else {
        // Outside of the clip shape the backdrop stays untouched, partially covered pixels are interpolated.
        const PremulColor blended = blend(src, dst, layer.blend);
        dst_pixels[x] = {
          dst.r + (blended.r - dst.r) * clip,
          dst.g + (blended.g - dst.g) * clip,
          dst.b + (blended.b - dst.b) * clip,
          dst.a + (blended.a - dst.a) * clip
        };
      }
    }
  }
}

Pixmap& CpuScenePainter::GetTarget() {
  if(m_layer_depth == 0u) {
    return m_base;
  }
  return m_layers[m_layer_depth - 1u].pixmap;
}

} // namespace multirender
