#include <multirender/math/ellipse.hpp>
#include <multirender/math/line.hpp>
#include <multirender/math/rounded_rect.hpp>
#include <multirender/paint/gradient.hpp>
#include <multirender/window/window_renderer_factory.hpp>
#include <multirender/logger/logger.hpp>
#include <multirender/panic.hpp>
#include <fmt/format.h>
#include <cmath>
#include <numbers>

#include "main_window.hpp"

namespace multirender {

MainWindow::MainWindow(RendererConfig config) : m_config{std::move(config)} {
}

MainWindow::~MainWindow() {
  // The renderer may own a GL context bound to the window, so it has to go first.
  m_window_renderer.reset();

  if(m_window != nullptr) {
    SDL_DestroyWindow(m_window);
  }
  SDL_Quit();
}

void MainWindow::Run() {
  Setup();
  MainLoop();
}

void MainWindow::Setup() {
  if(SDL_Init(SDL_INIT_VIDEO) != 0) {
    MULTIRENDER_PANIC("Failed to initialize SDL: {}", SDL_GetError());
  }

  m_window = SDL_CreateWindow(
    m_config.window_title.c_str(),
    SDL_WINDOWPOS_CENTERED,
    SDL_WINDOWPOS_CENTERED,
    (int)m_config.window_width,
    (int)m_config.window_height,
    SDL_WINDOW_RESIZABLE | GetRequiredSDLWindowFlags(m_config)
  );
  if(m_window == nullptr) {
    MULTIRENDER_PANIC("Failed to create window: {}", SDL_GetError());
  }

  m_width = m_config.window_width;
  m_height = m_config.window_height;

  m_window_renderer = CreateCpuWindowRenderer(m_config);
  m_window_renderer->Resume(m_window, m_width, m_height);

  m_time_point_start = std::chrono::steady_clock::now();
  m_time_point_last_update = m_time_point_start;
}

void MainWindow::MainLoop() {
  SDL_Event event{};

  while(true) {
    while(SDL_PollEvent(&event)) {
      if(event.type == SDL_QUIT) {
        return;
      }

      if(event.type == SDL_WINDOWEVENT) {
        switch(event.window.event) {
          case SDL_WINDOWEVENT_SIZE_CHANGED: {
            m_width = (u32)event.window.data1;
            m_height = (u32)event.window.data2;
            m_window_renderer->SetSize(m_width, m_height);
            break;
          }
          case SDL_WINDOWEVENT_MINIMIZED: {
            m_window_renderer->Suspend();
            break;
          }
          case SDL_WINDOWEVENT_RESTORED: {
            if(!m_window_renderer->IsActive()) {
              int width;
              int height;
              SDL_GetWindowSize(m_window, &width, &height);
              m_width = (u32)width;
              m_height = (u32)height;
              m_window_renderer->Resume(m_window, m_width, m_height);
            }
            break;
          }
        }
      }
    }

    if(!m_window_renderer->IsActive()) {
      SDL_WaitEvent(nullptr);
      continue;
    }

    RenderFrame();
  }
}

void MainWindow::RenderFrame() {
  m_window_renderer->Render([this](PaintScene& scene) {
    DrawScene(scene);
  });

  m_frame++;

  UpdateFramesPerSecondCounter();
}

void MainWindow::DrawScene(PaintScene& scene) const {
  const f64 time = std::chrono::duration<f64>(std::chrono::steady_clock::now() - m_time_point_start).count();

  const Affine center = Affine::Translate({(f64)m_width * 0.5, (f64)m_height * 0.5});

  // Card with a drop shadow
  const Rect card{-220.0, -140.0, 220.0, 140.0};
  scene.DrawBoxShadow(center * Affine::Translate({0.0, 12.0}), card, Color{0.0f, 0.0f, 0.0f, 0.4f}, 24.0, 16.0);
  scene.Fill(
    FillRule::NonZero, center,
    Gradient::NewLinear({-220.0, -140.0}, {220.0, 140.0}).WithColors({palette::css::CORNFLOWER_BLUE, palette::css::MAGENTA}),
    std::nullopt, RoundedRect{card, 24.0});

  // Spinning square, clipped to the card
  scene.PushClipLayer(center, RoundedRect{card, 24.0});
  scene.Fill(
    FillRule::NonZero, center * Affine::Rotate(time),
    palette::css::YELLOW.WithAlpha(0.8f),
    std::nullopt, Rect{-90.0, -90.0, 90.0, 90.0});
  scene.PopLayer();

  // Overlapping circles composited with a multiply layer
  scene.PushLayer(Mix::Multiply, 0.9f, Affine::Identity(), Rect{0.0, 0.0, (f64)m_width, (f64)m_height});
  for(int i = 0; i < 3; i++) {
    const f64 angle = time + (f64)i * 2.0 * std::numbers::pi / 3.0;
    const Point position{std::cos(angle) * 60.0, std::sin(angle) * 60.0};
    const Color colors[] = {palette::css::RED, palette::css::LIME, palette::css::BLUE};
    scene.Fill(FillRule::NonZero, center * Affine::Translate({0.0, 230.0}), colors[i], std::nullopt, Circle{position, 80.0});
  }
  scene.PopLayer();

  // Dashed outline orbiting the card
  const StrokeStyle dashed = StrokeStyle{6.0}.WithDashes(time * 40.0, {24.0, 12.0});
  scene.Stroke(dashed, center, palette::css::ORANGE, std::nullopt, Ellipse{{0.0, 0.0}, {300.0, 200.0}, 0.0});

  scene.Stroke(StrokeStyle{3.0}, center, palette::css::BLACK, std::nullopt, Line{{-260.0, 180.0}, {260.0, 180.0}});
}

void MainWindow::UpdateFramesPerSecondCounter() {
  const auto time_point_now = std::chrono::steady_clock::now();

  const auto time_elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    time_point_now - m_time_point_last_update).count();

  m_fps_counter++;

  if(time_elapsed >= 1000) {
    const f32 fps = (f32)m_fps_counter * 1000.0f / (f32)time_elapsed;
    fmt::print("{} fps\n", fps);
    m_fps_counter = 0;
    m_time_point_last_update = std::chrono::steady_clock::now();
  }
}

} // namespace multirender
