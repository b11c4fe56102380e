#include <multirender/logger/logger.hpp>
#include <multirender/math/rect.hpp>

#include "window_renderer.hpp"

namespace multirender {

SoftwareWindowRenderer::SoftwareWindowRenderer(const RendererConfig& config)
    : m_tolerance{config.tolerance}
    , m_clear_color{config.clear_color} {
}

void SoftwareWindowRenderer::Resume(SDL_Window* window, u32 width, u32 height) {
  m_window = window;
  m_image_renderer = std::make_unique<CpuImageRenderer>(width, height, m_tolerance);
  MULTIRENDER_INFO("SoftwareWindowRenderer: resumed at {}x{}", width, height);
}

void SoftwareWindowRenderer::Suspend() {
  m_image_renderer.reset();
  m_frame.clear();
  m_window = nullptr;
}

void SoftwareWindowRenderer::SetSize(u32 width, u32 height) {
  if(m_image_renderer) {
    m_image_renderer->Resize(width, height);
  }
}

void SoftwareWindowRenderer::Render(const DrawFn& draw_fn) {
  if(!IsActive()) {
    return;
  }

  const u32 width = m_image_renderer->GetWidth();
  const u32 height = m_image_renderer->GetHeight();
  if(width == 0u || height == 0u) {
    return;
  }

  const bool rendered = m_image_renderer->RenderToVector([&](PaintScene& scene) {
    scene.Fill(FillRule::NonZero, Affine::Identity(), m_clear_color, std::nullopt, Rect{0.0, 0.0, (f64)width, (f64)height});
    draw_fn(scene);
  }, m_frame);
  if(!rendered) {
    return;
  }

  // The window surface is recreated by SDL when the window is resized, so it is fetched for every frame.
  SDL_Surface* window_surface = SDL_GetWindowSurface(m_window);
  if(window_surface == nullptr) {
    MULTIRENDER_ERROR("SoftwareWindowRenderer: failed to get the window surface: {}", SDL_GetError());
    return;
  }

  SDL_Surface* frame_surface = SDL_CreateRGBSurfaceWithFormatFrom(
    m_frame.data(), (int)width, (int)height, 32, (int)width * 4, SDL_PIXELFORMAT_RGBA32);
  if(frame_surface == nullptr) {
    MULTIRENDER_ERROR("SoftwareWindowRenderer: failed to wrap the frame in a surface: {}", SDL_GetError());
    return;
  }

  SDL_SetSurfaceBlendMode(frame_surface, SDL_BLENDMODE_NONE);
  if(SDL_BlitSurface(frame_surface, nullptr, window_surface, nullptr) != 0) {
    MULTIRENDER_ERROR("SoftwareWindowRenderer: failed to blit the frame: {}", SDL_GetError());
  }
  SDL_FreeSurface(frame_surface);

  if(SDL_UpdateWindowSurface(m_window) != 0) {
    MULTIRENDER_ERROR("SoftwareWindowRenderer: failed to present the frame: {}", SDL_GetError());
  }
}

} // namespace multirender
