#pragma once

#include <multirender/paint/color.hpp>
#include <multirender/paint/gradient.hpp>
#include <multirender/paint/image.hpp>
#include <multirender/float.hpp>
#include <multirender/integer.hpp>
#include <span>
#include <vector>

namespace multirender {

/**
 * A rectangular buffer of premultiplied floating-point RGBA pixels, stored row-major with the top row first.
 */
class Pixmap {
  public:
    Pixmap() = default;
    Pixmap(u32 width, u32 height);

    /// Converts image pixel data into a premultiplied pixmap.
    static Pixmap FromImage(const ImageData& image);

    [[nodiscard]] u32 GetWidth() const {
      return m_width;
    }

    [[nodiscard]] u32 GetHeight() const {
      return m_height;
    }

    /// Resizes the pixmap, all pixels become transparent.
    void Resize(u32 width, u32 height);

    void Clear(const PremulColor& color = {});

    [[nodiscard]] PremulColor& At(u32 x, u32 y) {
      return m_pixels[(size_t)y * m_width + x];
    }

    [[nodiscard]] const PremulColor& At(u32 x, u32 y) const {
      return m_pixels[(size_t)y * m_width + x];
    }

    [[nodiscard]] std::span<PremulColor> Row(u32 y) {
      return {m_pixels.data() + (size_t)y * m_width, m_width};
    }

    [[nodiscard]] std::span<const PremulColor> Row(u32 y) const {
      return {m_pixels.data() + (size_t)y * m_width, m_width};
    }

    /**
     * Samples the pixmap at a position given in pixel units, where pixel (0, 0) covers [0, 1) x [0, 1).
     * Low quality picks the nearest pixel, Medium and High quality filter bilinearly.
     */
    [[nodiscard]] PremulColor Sample(f64 x, f64 y, Extend x_extend, Extend y_extend, ImageQuality quality) const;

    /// Writes the pixmap as straight-alpha RGBA8. `buffer` must hold width * height * 4 bytes.
    void WriteRgba8(std::span<u8> buffer) const;

  private:
    [[nodiscard]] PremulColor Fetch(i64 x, i64 y, Extend x_extend, Extend y_extend) const;

    u32 m_width{};
    u32 m_height{};
    std::vector<PremulColor> m_pixels{};
};

} // namespace multirender
