#pragma once

namespace multirender {

// Draws a single triangle covering the whole viewport, without any vertex buffers.
static constexpr auto k_present_vert_glsl = R"(
  #version 330 core

  out vec2 v_uv;

  void main() {
    vec2 position = vec2(float((gl_VertexID << 1) & 2), float(gl_VertexID & 2));

    // Row zero of the frame is the top row, but OpenGL textures start at the bottom.
    v_uv = vec2(position.x, 1.0 - position.y);

    gl_Position = vec4(position * 2.0 - 1.0, 0.0, 1.0);
  }
)";

static constexpr auto k_present_frag_glsl = R"(
  #version 330 core

  in vec2 v_uv;

  out vec4 frag_color;

  uniform sampler2D u_frame;

  void main() {
    frag_color = texture(u_frame, v_uv);
  }
)";

} // namespace multirender
