#include <multirender/recording/scene.hpp>
#include <type_traits>

namespace multirender {

void Scene::Reset() {
  m_commands.clear();
}

void Scene::PushLayer(const BlendMode& blend, f32 alpha, const Affine& transform, const Shape& clip) {
  m_commands.emplace_back(LayerCommand{
    .blend = blend,
    .alpha = alpha,
    .transform = transform,
    .clip = clip.ToPath(m_tolerance)
  });
}

void Scene::PushClipLayer(const Affine& transform, const Shape& clip) {
  m_commands.emplace_back(ClipCommand{
    .transform = transform,
    .clip = clip.ToPath(m_tolerance)
  });
}

void Scene::PopLayer() {
  m_commands.emplace_back(PopLayerCommand{});
}

void Scene::Stroke(const StrokeStyle& style, const Affine& transform, const Paint& paint, const std::optional<Affine>& brush_transform, const Shape& shape) {
  m_commands.emplace_back(StrokeCommand{
    .style = style,
    .transform = transform,
    .paint = paint,
    .brush_transform = brush_transform,
    .shape = shape.ToPath(m_tolerance)
  });
}

void Scene::Fill(FillRule style, const Affine& transform, const Paint& paint, const std::optional<Affine>& brush_transform, const Shape& shape) {
  m_commands.emplace_back(FillCommand{
    .fill = style,
    .transform = transform,
    .paint = paint,
    .brush_transform = brush_transform,
    .shape = shape.ToPath(m_tolerance)
  });
}

void Scene::DrawGlyphs(
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
  m_commands.emplace_back(GlyphRunCommand{
    .font = font,
    .font_size = font_size,
    .hint = hint,
    .normalized_coords = {normalized_coords.begin(), normalized_coords.end()},
    .style = style,
    .paint = paint,
    .brush_alpha = brush_alpha,
    .transform = transform,
    .glyph_transform = glyph_transform,
    .glyphs = {glyphs.begin(), glyphs.end()}
  });
}

void Scene::DrawBoxShadow(const Affine& transform, const Rect& rect, const Color& color, f64 radius, f64 std_dev) {
  m_commands.emplace_back(BoxShadowCommand{
    .transform = transform,
    .rect = rect,
    .color = color,
    .radius = radius,
    .std_dev = std_dev
  });
}

void Scene::RenderTo(PaintScene& painter) const {
  for(const RenderCommand& command : m_commands) {
    std::visit([&](const auto& cmd) {
      using T = std::decay_t<decltype(cmd)>;

      if constexpr(std::is_same_v<T, LayerCommand>) {
        painter.PushLayer(cmd.blend, cmd.alpha, cmd.transform, cmd.clip);
      } else if constexpr(std::is_same_v<T, ClipCommand>) {
        painter.PushClipLayer(cmd.transform, cmd.clip);
      } else if constexpr(std::is_same_v<T, PopLayerCommand>) {
        painter.PopLayer();
      } else if constexpr(std::is_same_v<T, StrokeCommand>) {
        painter.Stroke(cmd.style, cmd.transform, cmd.paint, cmd.brush_transform, cmd.shape);
      } else if constexpr(std::is_same_v<T, FillCommand>) {
        painter.Fill(cmd.fill, cmd.transform, cmd.paint, cmd.brush_transform, cmd.shape);
      } else if constexpr(std::is_same_v<T, GlyphRunCommand>) {
        painter.DrawGlyphs(
          cmd.font, cmd.font_size, cmd.hint, cmd.normalized_coords, cmd.style, cmd.paint,
          cmd.brush_alpha, cmd.transform, cmd.glyph_transform, cmd.glyphs);
      } else if constexpr(std::is_same_v<T, BoxShadowCommand>) {
        painter.DrawBoxShadow(cmd.transform, cmd.rect, cmd.color, cmd.radius, cmd.std_dev);
      }
    }, command);
  }
}

void Scene::Append(const Scene& other, const std::optional<Affine>& transform) {
  const size_t first_new_command = m_commands.size();

  if(&other == this) {
    // Inserting a range of a vector into itself is not allowed.
    const std::vector<RenderCommand> commands = other.m_commands;
    m_commands.insert(m_commands.end(), commands.begin(), commands.end());
  } else {
    m_commands.insert(m_commands.end(), other.m_commands.begin(), other.m_commands.end());
  }

  if(!transform.has_value()) {
    return;
  }

  // Brush and glyph transforms are relative to the command transform and stay untouched.
  for(size_t i = first_new_command; i < m_commands.size(); i++) {
    std::visit([&](auto& cmd) {
      using T = std::decay_t<decltype(cmd)>;

      if constexpr(!std::is_same_v<T, PopLayerCommand>) {
        cmd.transform = *transform * cmd.transform;
      }
    }, m_commands[i]);
  }
}

} // namespace multirender
