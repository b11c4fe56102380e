#pragma once

#include <multirender/recording/render_command.hpp>
#include <multirender/paint_scene.hpp>
#include <optional>
#include <vector>

namespace multirender {

/**
 * A PaintScene that records the drawing commands instead of executing them. The recording can be
 * replayed into any other PaintScene any number of times, serialized or appended to other scenes.
 * Shapes are converted into paths when they are recorded.
 */
class Scene final : public PaintScene {
  public:
    Scene() = default;
    explicit Scene(f64 tolerance) : m_tolerance{tolerance} {}

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

    /// Replays every recorded command, in recording order, into `painter`.
    void RenderTo(PaintScene& painter) const;

    /// Appends the commands of another scene, applying `transform` on top of their own transforms.
    void Append(const Scene& other, const std::optional<Affine>& transform = std::nullopt);

    /// Appends a command that was recorded (or deserialized) elsewhere.
    void PushCommand(RenderCommand command) {
      m_commands.push_back(std::move(command));
    }

    [[nodiscard]] const std::vector<RenderCommand>& GetCommands() const {
      return m_commands;
    }

    [[nodiscard]] bool IsEmpty() const {
      return m_commands.empty();
    }

    [[nodiscard]] f64 GetTolerance() const {
      return m_tolerance;
    }

  private:
    f64 m_tolerance{k_default_tolerance};
    std::vector<RenderCommand> m_commands{};
};

} // namespace multirender
