#include <multirender/window/window_renderer_factory.hpp>
#include <multirender/logger/logger.hpp>
#include <multirender/null_backend.hpp>
#include <SDL.h>

#include "software/window_renderer.hpp"

#ifdef MULTIRENDER_OPENGL
  #include "opengl/window_renderer.hpp"
#endif

namespace multirender {

std::unique_ptr<WindowRenderer> CreateCpuWindowRenderer(const RendererConfig& config) {
  switch(config.backend) {
    case WindowBackend::Null: {
      return std::make_unique<NullWindowRenderer>();
    }
    case WindowBackend::OpenGL: {
#ifdef MULTIRENDER_OPENGL
      return std::make_unique<OpenGLWindowRenderer>(config);
#else
      MULTIRENDER_WARN("CreateCpuWindowRenderer: built without OpenGL support, using the software renderer");
      return std::make_unique<SoftwareWindowRenderer>(config);
#endif
    }
    case WindowBackend::Software: {
      return std::make_unique<SoftwareWindowRenderer>(config);
    }
  }

  MULTIRENDER_UNREACHABLE();
}

u32 GetRequiredSDLWindowFlags(const RendererConfig& config) {
#ifdef MULTIRENDER_OPENGL
  if(config.backend == WindowBackend::OpenGL) {
    return SDL_WINDOW_OPENGL;
  }
#endif
  return 0u;
}

} // namespace multirender
