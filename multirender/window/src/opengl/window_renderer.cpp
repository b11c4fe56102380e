#include <multirender/logger/logger.hpp>
#include <multirender/math/rect.hpp>
#include <multirender/panic.hpp>
#include <string>

#include "shader/present.glsl.hpp"
#include "window_renderer.hpp"

namespace multirender {

OpenGLWindowRenderer::OpenGLWindowRenderer(const RendererConfig& config)
    : m_tolerance{config.tolerance}
    , m_clear_color{config.clear_color}
    , m_vsync{config.vsync} {
}

OpenGLWindowRenderer::~OpenGLWindowRenderer() {
  Suspend();
}

void OpenGLWindowRenderer::Resume(SDL_Window* window, u32 width, u32 height) {
  if(IsActive()) {
    Suspend();
  }

  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
  m_gl_context = SDL_GL_CreateContext(window);
  if(m_gl_context == nullptr) {
    MULTIRENDER_PANIC("OpenGL: failed to create OpenGL context: {}", SDL_GetError());
  }
  m_window = window;

  glewExperimental = GL_TRUE;
  const GLenum glew_result = glewInit();
  if(glew_result != GLEW_OK) {
    MULTIRENDER_PANIC("OpenGL: failed to load OpenGL functions: {}", (const char*)glewGetErrorString(glew_result));
  }

  if(SDL_GL_SetSwapInterval(m_vsync ? 1 : 0) != 0) {
    MULTIRENDER_WARN("OpenGL: failed to set the swap interval: {}", SDL_GetError());
  }

  CreatePresentProgram();

  // Core profile contexts refuse to draw without a bound vertex array, even if it holds no attributes.
  glGenVertexArrays(1, &m_gl_vao);

  glGenTextures(1, &m_gl_frame_texture);
  glBindTexture(GL_TEXTURE_2D, m_gl_frame_texture);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glBindTexture(GL_TEXTURE_2D, 0u);
  m_texture_width = 0u;
  m_texture_height = 0u;

  m_image_renderer = std::make_unique<CpuImageRenderer>(width, height, m_tolerance);

  MULTIRENDER_INFO("OpenGLWindowRenderer: resumed at {}x{} (OpenGL {})", width, height, (const char*)glGetString(GL_VERSION));
}

void OpenGLWindowRenderer::Suspend() {
  if(!IsActive()) {
    return;
  }

  m_image_renderer.reset();
  m_frame.clear();

  glDeleteTextures(1, &m_gl_frame_texture);
  glDeleteVertexArrays(1, &m_gl_vao);
  glDeleteProgram(m_gl_present_program);

  SDL_GL_DeleteContext(m_gl_context);
  m_gl_context = nullptr;
  m_window = nullptr;
}

void OpenGLWindowRenderer::SetSize(u32 width, u32 height) {
  if(m_image_renderer) {
    m_image_renderer->Resize(width, height);
  }
}

void OpenGLWindowRenderer::Render(const DrawFn& draw_fn) {
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

  glBindTexture(GL_TEXTURE_2D, m_gl_frame_texture);
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  if(width != m_texture_width || height != m_texture_height) {
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, (GLsizei)width, (GLsizei)height, 0, GL_RGBA, GL_UNSIGNED_BYTE, m_frame.data());
    m_texture_width = width;
    m_texture_height = height;
  } else {
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, (GLsizei)width, (GLsizei)height, GL_RGBA, GL_UNSIGNED_BYTE, m_frame.data());
  }

  glViewport(0, 0, (GLsizei)width, (GLsizei)height);
  glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
  glClear(GL_COLOR_BUFFER_BIT);

  glUseProgram(m_gl_present_program);
  glActiveTexture(GL_TEXTURE0);
  glUniform1i(glGetUniformLocation(m_gl_present_program, "u_frame"), 0);
  glBindVertexArray(m_gl_vao);
  glDrawArrays(GL_TRIANGLES, 0, 3);
  glBindVertexArray(0u);
  glBindTexture(GL_TEXTURE_2D, 0u);

  SDL_GL_SwapWindow(m_window);
}

void OpenGLWindowRenderer::CreatePresentProgram() {
  GLuint vert_shader = CreateShader(k_present_vert_glsl, GL_VERTEX_SHADER);
  GLuint frag_shader = CreateShader(k_present_frag_glsl, GL_FRAGMENT_SHADER);

  m_gl_present_program = CreateProgram({{vert_shader, frag_shader}});
  glDeleteShader(vert_shader);
  glDeleteShader(frag_shader);
}

GLuint OpenGLWindowRenderer::CreateShader(const char* glsl_code, GLenum type) {
  GLuint gl_shader = glCreateShader(type);

  const char* glsl_code_array[] = {glsl_code};
  glShaderSource(gl_shader, 1, glsl_code_array, nullptr);
  glCompileShader(gl_shader);

  GLint compile_succeeded;
  glGetShaderiv(gl_shader, GL_COMPILE_STATUS, &compile_succeeded);
  if(compile_succeeded == GL_FALSE) {
    GLint info_log_length;
    glGetShaderiv(gl_shader, GL_INFO_LOG_LENGTH, &info_log_length);

    std::string info_log((size_t)info_log_length, '\0');
    glGetShaderInfoLog(gl_shader, info_log_length, &info_log_length, info_log.data());
    MULTIRENDER_PANIC("OpenGL: failed to compile GLSL shader:\n{}", info_log);
  }

  return gl_shader;
}

GLuint OpenGLWindowRenderer::CreateProgram(std::span<const GLuint> shaders) {
  GLuint gl_program = glCreateProgram();

  for(auto shader_object : shaders) {
    glAttachShader(gl_program, shader_object);
  }
  glLinkProgram(gl_program);

  GLint link_succeeded;
  glGetProgramiv(gl_program, GL_LINK_STATUS, &link_succeeded);
  if(link_succeeded == GL_FALSE) {
    GLint info_log_length;
    glGetProgramiv(gl_program, GL_INFO_LOG_LENGTH, &info_log_length);

    std::string info_log((size_t)info_log_length, '\0');
    glGetProgramInfoLog(gl_program, info_log_length, &info_log_length, info_log.data());
    MULTIRENDER_PANIC("OpenGL: failed to link GLSL program:\n{}", info_log);
  }

  return gl_program;
}

} // namespace multirender
