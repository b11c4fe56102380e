#pragma once

#include <multirender/image_renderer.hpp>
#include <multirender/integer.hpp>

struct SDL_Window;

namespace multirender {

/**
 * Presents frames to a window. A window renderer starts suspended; Resume() binds it to a window
 * and acquires the presentation resources, Suspend() releases them again.
 */
class WindowRenderer {
  public:
    virtual ~WindowRenderer() = default;

    [[nodiscard]] virtual bool IsActive() const = 0;

    virtual void Resume(SDL_Window* window, u32 width, u32 height) = 0;

    virtual void Suspend() = 0;

    virtual void SetSize(u32 width, u32 height) = 0;

    /// Renders and presents a frame. Does nothing while the renderer is suspended.
    virtual void Render(const DrawFn& draw_fn) = 0;
};

} // namespace multirender
