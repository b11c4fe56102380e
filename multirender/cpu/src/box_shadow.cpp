#include <multirender/cpu/box_shadow.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace multirender {

namespace {

constexpr int k_vertical_samples = 4;

f64 gaussian(f64 x, f64 sigma) {
  return std::exp(-(x * x) / (2.0 * sigma * sigma)) / (std::sqrt(2.0 * std::numbers::pi) * sigma);
}

/// Blurred coverage along x of the rounded rectangle's horizontal slice at height `y`.
f64 blurred_row_coverage(f64 x, f64 y, f64 sigma, f64 corner, f64 half_width, f64 half_height) {
  const f64 delta = std::min(half_height - corner - std::abs(y), 0.0);
  const f64 curved = half_width - corner + std::sqrt(std::max(0.0, corner * corner - delta * delta));
  const f64 scale = std::numbers::sqrt2 * 0.5 / sigma;
  const f64 low = 0.5 + 0.5 * std::erf((x - curved) * scale);
  const f64 high = 0.5 + 0.5 * std::erf((x + curved) * scale);
  return high - low;
}

} // anonymous namespace

f32 evaluate_box_shadow(const Point& point, const Rect& rect, f64 radius, f64 std_dev) {
  const Rect r = rect.Abs();
  const f64 half_width = r.Width() * 0.5;
  const f64 half_height = r.Height() * 0.5;
  const f64 corner = std::clamp(radius, 0.0, std::min(half_width, half_height));

  const Point center = r.Center();
  const f64 x = point.x - center.x;
  const f64 y = point.y - center.y;

  if(!(std_dev > 0.0)) {
    // Without blur this is the plain rounded rectangle.
    const f64 qx = std::abs(x) - (half_width - corner);
    const f64 qy = std::abs(y) - (half_height - corner);
    if(qx > corner || qy > corner) {
      return 0.0f;
    }
    if(qx > 0.0 && qy > 0.0) {
      return std::hypot(qx, qy) <= corner ? 1.0f : 0.0f;
    }
    return 1.0f;
  }

  // The Gaussian is negligible beyond three standard deviations.
  const f64 low = y - half_height;
  const f64 high = y + half_height;
  const f64 start = std::clamp(-3.0 * std_dev, low, high);
  const f64 end = std::clamp(3.0 * std_dev, low, high);
  const f64 step = (end - start) / k_vertical_samples;

  f64 value = 0.0;
  f64 sample_y = start + step * 0.5;
  for(int i = 0; i < k_vertical_samples; i++) {
    value += blurred_row_coverage(x, y - sample_y, std_dev, corner, half_width, half_height) * gaussian(sample_y, std_dev) * step;
    sample_y += step;
  }

  return (f32)std::clamp(value, 0.0, 1.0);
}

} // namespace multirender
