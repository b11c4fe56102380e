#include <multirender/paint/gradient.hpp>
#include <algorithm>
#include <cmath>

namespace multirender {

f32 apply_extend(f32 t, Extend extend) {
  switch(extend) {
    case Extend::Pad: {
      return std::clamp(t, 0.0f, 1.0f);
    }
    case Extend::Repeat: {
      return t - std::floor(t);
    }
    case Extend::Reflect: {
      const f32 period = t - 2.0f * std::floor(t * 0.5f);
      return period > 1.0f ? 2.0f - period : period;
    }
  }
  return t;
}

Gradient& Gradient::WithStops(std::vector<ColorStop> stops) {
  std::ranges::stable_sort(stops, {}, &ColorStop::offset);
  m_stops = std::move(stops);
  return *this;
}

Gradient& Gradient::WithColors(const std::vector<Color>& colors) {
  std::vector<ColorStop> stops{};
  stops.reserve(colors.size());

  const size_t count = colors.size();
  for(size_t i = 0; i < count; i++) {
    const f32 offset = count > 1u ? (f32)i / (f32)(count - 1u) : 0.0f;
    stops.push_back({offset, colors[i]});
  }
  return WithStops(std::move(stops));
}

Color Gradient::Evaluate(f32 t) const {
  if(m_stops.empty()) {
    return palette::css::TRANSPARENT;
  }

  if(t <= m_stops.front().offset) {
    return m_stops.front().color;
  }

  for(size_t i = 1; i < m_stops.size(); i++) {
    const ColorStop& stop_b = m_stops[i];
    if(t <= stop_b.offset) {
      const ColorStop& stop_a = m_stops[i - 1u];
      const f32 span = stop_b.offset - stop_a.offset;
      if(span <= 0.0f) {
        return stop_b.color;
      }
      return stop_a.color.Lerp(stop_b.color, (t - stop_a.offset) / span);
    }
  }

  return m_stops.back().color;
}

} // namespace multirender
