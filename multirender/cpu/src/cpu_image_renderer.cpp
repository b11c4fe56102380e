#include <multirender/cpu/cpu_image_renderer.hpp>
#include <multirender/logger/logger.hpp>

namespace multirender {

CpuImageRenderer::CpuImageRenderer(u32 width, u32 height, f64 tolerance)
    : m_width{width}
    , m_height{height}
    , m_painter{width, height, m_image_cache, tolerance} {
}

void CpuImageRenderer::Resize(u32 width, u32 height) {
  if(width == m_width && height == m_height) {
    return;
  }
  m_width = width;
  m_height = height;
  m_painter.Resize(width, height);
}

void CpuImageRenderer::Reset() {
  m_painter.Reset();
  m_image_cache.Clear();
}

bool CpuImageRenderer::Render(const DrawFn& draw_fn, std::span<u8> buffer) {
  const size_t expected_size = (size_t)m_width * (size_t)m_height * 4u;
  if(buffer.size() != expected_size) {
    MULTIRENDER_ERROR("CpuImageRenderer: expected a buffer of {} bytes but got {}", expected_size, buffer.size());
    return false;
  }

  RenderToPixmap(draw_fn).WriteRgba8(buffer);
  return true;
}

const Pixmap& CpuImageRenderer::RenderToPixmap(const DrawFn& draw_fn) {
  m_painter.Reset();
  draw_fn(m_painter);
  m_painter.Finish();
  return m_painter.GetPixmap();
}

void CpuImageRenderer::SetGlyphOutlineProvider(std::shared_ptr<GlyphOutlineProvider> provider) {
  m_glyph_outline_provider = std::move(provider);
  m_painter.SetGlyphOutlineProvider(m_glyph_outline_provider.get());
}

} // namespace multirender
