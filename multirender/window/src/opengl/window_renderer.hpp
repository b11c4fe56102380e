#pragma once

#include <multirender/cpu/cpu_image_renderer.hpp>
#include <multirender/config.hpp>
#include <multirender/window_renderer.hpp>
#include <GL/glew.h>
#include <GL/gl.h>
#include <SDL.h>
#include <SDL_opengl.h>
#include <memory>
#include <span>
#include <vector>

namespace multirender {

/**
 * Presents frames rendered on the CPU by uploading them into a texture that is drawn with OpenGL.
 * The window must have been created with SDL_WINDOW_OPENGL.
 */
class OpenGLWindowRenderer final : public WindowRenderer {
  public:
    explicit OpenGLWindowRenderer(const RendererConfig& config);
   ~OpenGLWindowRenderer() override;

    [[nodiscard]] bool IsActive() const override {
      return m_gl_context != nullptr;
    }

    void Resume(SDL_Window* window, u32 width, u32 height) override;
    void Suspend() override;
    void SetSize(u32 width, u32 height) override;
    void Render(const DrawFn& draw_fn) override;

  private:
    void CreatePresentProgram();

    static GLuint CreateShader(const char* glsl_code, GLenum type);
    static GLuint CreateProgram(std::span<const GLuint> shaders);

    f64 m_tolerance;
    Color m_clear_color;
    bool m_vsync;

    SDL_Window* m_window{};
    SDL_GLContext m_gl_context{};
    GLuint m_gl_present_program{};
    GLuint m_gl_vao{};
    GLuint m_gl_frame_texture{};
    u32 m_texture_width{};
    u32 m_texture_height{};

    std::unique_ptr<CpuImageRenderer> m_image_renderer{};
    std::vector<u8> m_frame{};
};

} // namespace multirender
