#pragma once

#include <multirender/config.hpp>
#include <multirender/window_renderer.hpp>
#include <multirender/paint_scene.hpp>
#include <multirender/float.hpp>
#include <multirender/integer.hpp>
#include <SDL.h>
#include <chrono>
#include <memory>

#undef main

namespace multirender {

class MainWindow {
  public:
    explicit MainWindow(RendererConfig config);
   ~MainWindow();

    void Run();

  private:
    void Setup();
    void MainLoop();
    void RenderFrame();
    void DrawScene(PaintScene& scene) const;
    void UpdateFramesPerSecondCounter();

    RendererConfig m_config;
    std::unique_ptr<WindowRenderer> m_window_renderer{};
    SDL_Window* m_window{};
    u32 m_width{};
    u32 m_height{};

    int m_fps_counter{};
    std::chrono::steady_clock::time_point m_time_point_last_update{};
    std::chrono::steady_clock::time_point m_time_point_start{};
    u64 m_frame{};
};

} // namespace multirender
