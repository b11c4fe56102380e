#pragma once

#include <multirender/float.hpp>
#include <multirender/integer.hpp>
#include <algorithm>
#include <span>
#include <vector>

namespace multirender {

/// A half-open range of pixels [x0, x1) x [y0, y1).
struct PixelBounds {
  i32 x0{};
  i32 y0{};
  i32 x1{};
  i32 y1{};

  [[nodiscard]] bool IsEmpty() const {
    return x0 >= x1 || y0 >= y1;
  }

  [[nodiscard]] PixelBounds Intersect(const PixelBounds& other) const {
    return {std::max(x0, other.x0), std::max(y0, other.y0), std::min(x1, other.x1), std::min(y1, other.y1)};
  }

  bool operator==(const PixelBounds& other) const = default;
};

/**
 * Per-pixel coverage in the range [0, 1]. Pixels outside of the bounds are known to have zero coverage.
 */
class Mask {
  public:
    Mask() = default;
    Mask(u32 width, u32 height) {
      Resize(width, height);
    }

    void Resize(u32 width, u32 height) {
      m_width = width;
      m_height = height;
      m_coverage.assign((size_t)width * height, 0.0f);
      m_bounds = {};
    }

    /// Sets every pixel to zero coverage. Only the pixels within the bounds need to be touched.
    void Clear() {
      for(i32 y = m_bounds.y0; y < m_bounds.y1; y++) {
        const auto row = Row((u32)y);
        std::fill(row.begin() + m_bounds.x0, row.begin() + m_bounds.x1, 0.0f);
      }
      m_bounds = {};
    }

    /// Sets every pixel to full coverage.
    void Fill() {
      std::ranges::fill(m_coverage, 1.0f);
      m_bounds = {0, 0, (i32)m_width, (i32)m_height};
    }

    [[nodiscard]] u32 GetWidth() const {
      return m_width;
    }

    [[nodiscard]] u32 GetHeight() const {
      return m_height;
    }

    [[nodiscard]] f32 At(u32 x, u32 y) const {
      return m_coverage[(size_t)y * m_width + x];
    }

    [[nodiscard]] std::span<f32> Row(u32 y) {
      return {m_coverage.data() + (size_t)y * m_width, m_width};
    }

    [[nodiscard]] std::span<const f32> Row(u32 y) const {
      return {m_coverage.data() + (size_t)y * m_width, m_width};
    }

    [[nodiscard]] const PixelBounds& GetBounds() const {
      return m_bounds;
    }

    void SetBounds(const PixelBounds& bounds) {
      m_bounds = bounds;
    }

  private:
    u32 m_width{};
    u32 m_height{};
    std::vector<f32> m_coverage{};
    PixelBounds m_bounds{};
};

} // namespace multirender
