#pragma once

#include <multirender/cpu/cpu_scene_painter.hpp>
#include <multirender/cpu/glyph_outline_provider.hpp>
#include <multirender/cpu/image_cache.hpp>
#include <multirender/image_renderer.hpp>
#include <multirender/math/shape.hpp>
#include <multirender/float.hpp>
#include <multirender/integer.hpp>
#include <memory>

namespace multirender {

class CpuImageRenderer final : public ImageRenderer {
  public:
    CpuImageRenderer(u32 width, u32 height, f64 tolerance = k_default_tolerance);

    [[nodiscard]] u32 GetWidth() const override {
      return m_width;
    }

    [[nodiscard]] u32 GetHeight() const override {
      return m_height;
    }

    void Resize(u32 width, u32 height) override;
    void Reset() override;
    bool Render(const DrawFn& draw_fn, std::span<u8> buffer) override;

    /// Renders a frame and returns the premultiplied result. The pixmap stays valid until the next frame.
    const Pixmap& RenderToPixmap(const DrawFn& draw_fn);

    void SetGlyphOutlineProvider(std::shared_ptr<GlyphOutlineProvider> provider);

    [[nodiscard]] const ImageCache& GetImageCache() const {
      return m_image_cache;
    }

  private:
    u32 m_width;
    u32 m_height;
    ImageCache m_image_cache{};
    CpuScenePainter m_painter;
    std::shared_ptr<GlyphOutlineProvider> m_glyph_outline_provider{};
};

} // namespace multirender
