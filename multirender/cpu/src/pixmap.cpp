#include <multirender/cpu/pixmap.hpp>
#include <multirender/panic.hpp>
#include <algorithm>
#include <array>
#include <cmath>

namespace multirender {

// Sample coordinates are clamped to this magnitude before they are converted to texel indices.
static constexpr f64 k_max_sample_coordinate = 1099511627776.0; // 2^40

Pixmap::Pixmap(u32 width, u32 height) {
  Resize(width, height);
}

Pixmap Pixmap::FromImage(const ImageData& image) {
  if(!image.IsValid()) {
    MULTIRENDER_PANIC("Pixmap: image data does not match its size of {}x{}", image.width, image.height);
  }

  Pixmap pixmap{image.width, image.height};

  const std::span<const u8> data = image.data->Data();
  const bool bgra = image.format == ImageFormat::Bgra8;
  const bool premultiplied = image.alpha_type == ImageAlphaType::AlphaPremultiplied;

  for(size_t i = 0; i < pixmap.m_pixels.size(); i++) {
    const u8* texel = &data[i * 4u];

    const f32 r = (f32)texel[bgra ? 2 : 0] / 255.0f;
    const f32 g = (f32)texel[1] / 255.0f;
    const f32 b = (f32)texel[bgra ? 0 : 2] / 255.0f;
    const f32 a = (f32)texel[3] / 255.0f;

    if(premultiplied) {
      pixmap.m_pixels[i] = {std::min(r, a), std::min(g, a), std::min(b, a), a};
    } else {
      pixmap.m_pixels[i] = {r * a, g * a, b * a, a};
    }
  }

  return pixmap;
}

void Pixmap::Resize(u32 width, u32 height) {
  m_width = width;
  m_height = height;
  m_pixels.assign((size_t)width * height, PremulColor{});
}

void Pixmap::Clear(const PremulColor& color) {
  std::ranges::fill(m_pixels, color);
}

PremulColor Pixmap::Fetch(i64 x, i64 y, Extend x_extend, Extend y_extend) const {
  const auto extend = [](i64 coord, i64 size, Extend mode) -> i64 {
    switch(mode) {
      case Extend::Pad: {
        return std::clamp<i64>(coord, 0, size - 1);
      }
      case Extend::Repeat: {
        const i64 wrapped = coord % size;
        return wrapped < 0 ? wrapped + size : wrapped;
      }
      case Extend::Reflect: {
        const i64 period = size * 2;
        i64 wrapped = coord % period;
        if(wrapped < 0) wrapped += period;
        return wrapped < size ? wrapped : period - 1 - wrapped;
      }
    }
    return 0;
  };

  return At((u32)extend(x, m_width, x_extend), (u32)extend(y, m_height, y_extend));
}

PremulColor Pixmap::Sample(f64 x, f64 y, Extend x_extend, Extend y_extend, ImageQuality quality) const {
  if(m_width == 0u || m_height == 0u || std::isnan(x) || std::isnan(y)) {
    return {};
  }

  x = std::clamp(x, -k_max_sample_coordinate, k_max_sample_coordinate);
  y = std::clamp(y, -k_max_sample_coordinate, k_max_sample_coordinate);

  if(quality == ImageQuality::Low) {
    return Fetch((i64)std::floor(x), (i64)std::floor(y), x_extend, y_extend);
  }

  // Texel centers sit at half-integer positions.
  const f64 sx = x - 0.5;
  const f64 sy = y - 0.5;
  const f64 x0 = std::floor(sx);
  const f64 y0 = std::floor(sy);
  const f32 fx = (f32)(sx - x0);
  const f32 fy = (f32)(sy - y0);
  const i64 ix = (i64)x0;
  const i64 iy = (i64)y0;

  const PremulColor c00 = Fetch(ix, iy, x_extend, y_extend);
  const PremulColor c10 = Fetch(ix + 1, iy, x_extend, y_extend);
  const PremulColor c01 = Fetch(ix, iy + 1, x_extend, y_extend);
  const PremulColor c11 = Fetch(ix + 1, iy + 1, x_extend, y_extend);

  const auto lerp = [](const PremulColor& a, const PremulColor& b, f32 t) -> PremulColor {
    return {a.r + (b.r - a.r) * t, a.g + (b.g - a.g) * t, a.b + (b.b - a.b) * t, a.a + (b.a - a.a) * t};
  };

  return lerp(lerp(c00, c10, fx), lerp(c01, c11, fx), fy);
}

void Pixmap::WriteRgba8(std::span<u8> buffer) const {
  if(buffer.size() != m_pixels.size() * 4u) {
    MULTIRENDER_PANIC("Pixmap: output buffer has {} bytes but {} are required", buffer.size(), m_pixels.size() * 4u);
  }

  for(size_t i = 0; i < m_pixels.size(); i++) {
    const std::array<u8, 4> rgba = m_pixels[i].Unpremultiply().ToRgba8();
    std::copy(rgba.begin(), rgba.end(), buffer.begin() + (std::ptrdiff_t)(i * 4u));
  }
}

} // namespace multirender
