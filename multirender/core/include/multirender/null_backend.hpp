#pragma once

#include <multirender/image_renderer.hpp>
#include <multirender/paint_scene.hpp>
#include <multirender/window_renderer.hpp>

namespace multirender {

/// Accepts every drawing command and does nothing with it.
class NullScenePainter final : public PaintScene {
  public:
    void Reset() override {}
    void PushLayer(const BlendMode& blend, f32 alpha, const Affine& transform, const Shape& clip) override {}
    void PushClipLayer(const Affine& transform, const Shape& clip) override {}
    void PopLayer() override {}
    void Stroke(const StrokeStyle& style, const Affine& transform, const Paint& paint, const std::optional<Affine>& brush_transform, const Shape& shape) override {}
    void Fill(FillRule style, const Affine& transform, const Paint& paint, const std::optional<Affine>& brush_transform, const Shape& shape) override {}
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
    ) override {}
    void DrawBoxShadow(const Affine& transform, const Rect& rect, const Color& color, f64 radius, f64 std_dev) override {}
};

/// Runs the draw function against a NullScenePainter and outputs fully transparent frames.
class NullImageRenderer final : public ImageRenderer {
  public:
    NullImageRenderer(u32 width, u32 height) : m_width{width}, m_height{height} {}

    [[nodiscard]] u32 GetWidth() const override { return m_width; }
    [[nodiscard]] u32 GetHeight() const override { return m_height; }

    void Resize(u32 width, u32 height) override;
    void Reset() override {}
    bool Render(const DrawFn& draw_fn, std::span<u8> buffer) override;

  private:
    u32 m_width;
    u32 m_height;
};

/// Tracks the resume/suspend state of a window without presenting anything.
class NullWindowRenderer final : public WindowRenderer {
  public:
    [[nodiscard]] bool IsActive() const override {
      return m_active;
    }

    void Resume(SDL_Window* window, u32 width, u32 height) override;
    void Suspend() override;
    void SetSize(u32 width, u32 height) override;
    void Render(const DrawFn& draw_fn) override;

    [[nodiscard]] u64 GetNumberOfRenderedFrames() const {
      return m_number_of_rendered_frames;
    }

  private:
    bool m_active{false};
    u32 m_width{};
    u32 m_height{};
    u64 m_number_of_rendered_frames{};
};

} // namespace multirender
