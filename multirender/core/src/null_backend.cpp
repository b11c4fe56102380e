#include <multirender/logger/logger.hpp>
#include <multirender/null_backend.hpp>
#include <algorithm>

namespace multirender {

void NullImageRenderer::Resize(u32 width, u32 height) {
  m_width = width;
  m_height = height;
}

bool NullImageRenderer::Render(const DrawFn& draw_fn, std::span<u8> buffer) {
  const size_t expected_size = (size_t)m_width * (size_t)m_height * 4u;
  if(buffer.size() != expected_size) {
    MULTIRENDER_ERROR("NullImageRenderer: expected a buffer of {} bytes but got {}", expected_size, buffer.size());
    return false;
  }

  NullScenePainter painter{};
  draw_fn(painter);

  std::ranges::fill(buffer, (u8)0u);
  return true;
}

void NullWindowRenderer::Resume(SDL_Window* window, u32 width, u32 height) {
  m_active = true;
  m_width = width;
  m_height = height;
}

void NullWindowRenderer::Suspend() {
  m_active = false;
}

void NullWindowRenderer::SetSize(u32 width, u32 height) {
  m_width = width;
  m_height = height;
}

void NullWindowRenderer::Render(const DrawFn& draw_fn) {
  if(!m_active) {
    return;
  }

  NullScenePainter painter{};
  draw_fn(painter);
  m_number_of_rendered_frames++;
}

} // namespace multirender
