#pragma once

#include <multirender/cpu/cpu_image_renderer.hpp>
#include <multirender/config.hpp>
#include <multirender/window_renderer.hpp>
#include <SDL.h>
#include <memory>
#include <vector>

namespace multirender {

/**
 * Presents frames rendered on the CPU by blitting them onto the SDL window surface.
 */
class SoftwareWindowRenderer final : public WindowRenderer {
  public:
    explicit SoftwareWindowRenderer(const RendererConfig& config);

    [[nodiscard]] bool IsActive() const override {
      return m_window != nullptr;
    }

    void Resume(SDL_Window* window, u32 width, u32 height) override;
    void Suspend() override;
    void SetSize(u32 width, u32 height) override;
    void Render(const DrawFn& draw_fn) override;

  private:
    f64 m_tolerance;
    Color m_clear_color;
    SDL_Window* m_window{};
    std::unique_ptr<CpuImageRenderer> m_image_renderer{};
    std::vector<u8> m_frame{};
};

} // namespace multirender
