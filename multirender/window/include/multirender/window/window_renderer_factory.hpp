#pragma once

#include <multirender/config.hpp>
#include <multirender/window_renderer.hpp>
#include <multirender/integer.hpp>
#include <memory>

namespace multirender {

/**
 * Creates the window renderer selected by `config.backend`. The OpenGL presenter is only available when
 * MultiRender was built with MULTIRENDER_OPENGL, otherwise the software presenter is used instead.
 */
std::unique_ptr<WindowRenderer> CreateCpuWindowRenderer(const RendererConfig& config);

/// @returns the SDL_WindowFlags a window needs to be usable by the renderer CreateCpuWindowRenderer() selects
u32 GetRequiredSDLWindowFlags(const RendererConfig& config);

} // namespace multirender
