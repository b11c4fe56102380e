#pragma once

#include <multirender/paint_scene.hpp>
#include <multirender/integer.hpp>
#include <functional>
#include <span>
#include <vector>

namespace multirender {

using DrawFn = std::function<void(PaintScene&)>;

/**
 * Renders frames into memory. The output is straight-alpha RGBA8, row-major, top row first.
 */
class ImageRenderer {
  public:
    virtual ~ImageRenderer() = default;

    [[nodiscard]] virtual u32 GetWidth() const = 0;
    [[nodiscard]] virtual u32 GetHeight() const = 0;

    virtual void Resize(u32 width, u32 height) = 0;

    /// Drops any state carried over between frames (for example cached images).
    virtual void Reset() = 0;

    /**
     * Renders a frame produced by `draw_fn` into `buffer`.
     * @returns false (and leaves the buffer untouched) if the buffer size is not width * height * 4.
     */
    virtual bool Render(const DrawFn& draw_fn, std::span<u8> buffer) = 0;

    /// Renders a frame into `buffer`, resizing it to width * height * 4 bytes.
    bool RenderToVector(const DrawFn& draw_fn, std::vector<u8>& buffer) {
      buffer.resize((size_t)GetWidth() * (size_t)GetHeight() * 4u);
      return Render(draw_fn, buffer);
    }
};

} // namespace multirender
