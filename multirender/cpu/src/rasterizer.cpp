#include <multirender/cpu/rasterizer.hpp>
#include <multirender/panic.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace multirender {

void Rasterizer::AddPath(const BezPath& path, const Affine& transform, f64 tolerance) {
  Point start{};
  Point current{};
  bool open = false;

  path.Transformed(transform).Flatten(tolerance, [&](const PathElement& element) {
    switch(element.kind) {
      case PathElement::Kind::MoveTo: {
        if(open) {
          AddLine(current, start);
        }
        start = current = element.points[0];
        open = true;
        break;
      }
      case PathElement::Kind::LineTo: {
        AddLine(current, element.points[0]);
        current = element.points[0];
        break;
      }
      case PathElement::Kind::ClosePath: {
        AddLine(current, start);
        current = start;
        open = false;
        break;
      }
      default: {
        MULTIRENDER_UNREACHABLE();
      }
    }
  });

  if(open) {
    AddLine(current, start);
  }
}

void Rasterizer::AddLine(const Point& p0, const Point& p1) {
  if(p0.y == p1.y) {
    return;
  }

  if(!std::isfinite(p0.x) || !std::isfinite(p0.y) || !std::isfinite(p1.x) || !std::isfinite(p1.y)) [[unlikely]] {
    return;
  }

  // Edges are stored top to bottom, the winding remembers the original direction.
  if(p0.y < p1.y) {
    m_edges.push_back({p0.x, p0.y, p1.x, p1.y, (p1.x - p0.x) / (p1.y - p0.y), 1});
  } else {
    m_edges.push_back({p1.x, p1.y, p0.x, p0.y, (p0.x - p1.x) / (p0.y - p1.y), -1});
  }
}

void Rasterizer::Rasterize(FillRule fill_rule, Mask& mask) {
  if(mask.GetWidth() != m_width || mask.GetHeight() != m_height) {
    mask.Resize(m_width, m_height);
  } else {
    mask.Clear();
  }

  if(m_edges.empty() || m_width == 0u || m_height == 0u) {
    return;
  }

  std::ranges::sort(m_edges, [](const Edge& a, const Edge& b) { return a.y0 < b.y0; });

  f64 min_y = std::numeric_limits<f64>::max();
  f64 max_y = std::numeric_limits<f64>::lowest();
  for(const Edge& edge : m_edges) {
    min_y = std::min(min_y, edge.y0);
    max_y = std::max(max_y, edge.y1);
  }

  const i32 row_begin = (i32)std::clamp(std::floor(min_y), 0.0, (f64)m_height);
  const i32 row_end = (i32)std::clamp(std::ceil(max_y), 0.0, (f64)m_height);

  i32 min_x = (i32)m_width;
  i32 max_x = 0;
  i32 min_row = row_end;
  i32 max_row = row_begin;

  constexpr f32 k_sample_weight = 1.0f / (f32)k_sub_scanlines;

  size_t next_edge = 0u;
  m_active_edges.clear();

  for(i32 y = row_begin; y < row_end; y++) {
    const std::span<f32> row = mask.Row((u32)y);
    bool row_touched = false;

    for(int sample = 0; sample < k_sub_scanlines; sample++) {
      const f64 sample_y = (f64)y + ((f64)sample + 0.5) / k_sub_scanlines;

      std::erase_if(m_active_edges, [&](size_t index) { return m_edges[index].y1 <= sample_y; });

      while(next_edge < m_edges.size() && m_edges[next_edge].y0 <= sample_y) {
        if(m_edges[next_edge].y1 > sample_y) {
          m_active_edges.push_back(next_edge);
        }
        next_edge++;
      }

      if(m_active_edges.empty()) {
        continue;
      }

      m_crossings.clear();
      for(const size_t index : m_active_edges) {
        const Edge& edge = m_edges[index];
        m_crossings.push_back({edge.x0 + (sample_y - edge.y0) * edge.dxdy, edge.winding});
      }
      std::ranges::sort(m_crossings, [](const Crossing& a, const Crossing& b) { return a.x < b.x; });

      int winding = 0;
      for(size_t i = 0; i + 1 < m_crossings.size(); i++) {
        winding += m_crossings[i].winding;

        const bool inside = fill_rule == FillRule::NonZero ? winding != 0 : (winding & 1) != 0;
        if(!inside) {
          continue;
        }

        const f64 x0 = m_crossings[i].x;
        const f64 x1 = m_crossings[i + 1].x;
        if(x1 <= 0.0 || x0 >= (f64)m_width || x1 <= x0) {
          continue;
        }

        AccumulateSpan(row, x0, x1, k_sample_weight);
        min_x = std::min(min_x, (i32)std::max(std::floor(x0), 0.0));
        max_x = std::max(max_x, (i32)std::min(std::ceil(x1), (f64)m_width));
        row_touched = true;
      }
    }

    if(row_touched) {
      min_row = std::min(min_row, y);
      max_row = std::max(max_row, y + 1);
    }
  }

  if(min_row >= max_row || min_x >= max_x) {
    return;
  }

  for(i32 y = min_row; y < max_row; y++) {
    const std::span<f32> row = mask.Row((u32)y);
    for(i32 x = min_x; x < max_x; x++) {
      row[x] = std::min(row[x], 1.0f);
    }
  }

  mask.SetBounds({min_x, min_row, max_x, max_row});
}

void Rasterizer::AccumulateSpan(std::span<f32> row, f64 x0, f64 x1, f32 weight) {
  const f64 width = (f64)row.size();
  x0 = std::clamp(x0, 0.0, width);
  x1 = std::clamp(x1, 0.0, width);
  if(x1 <= x0) {
    return;
  }

  const size_t i0 = (size_t)x0;
  const size_t i1 = (size_t)x1;

  if(i0 == i1) {
    row[i0] += (f32)(x1 - x0) * weight;
    return;
  }

  row[i0] += (f32)((f64)(i0 + 1u) - x0) * weight;
  for(size_t i = i0 + 1u; i < i1; i++) {
    row[i] += weight;
  }
  if(i1 < row.size()) {
    row[i1] += (f32)(x1 - (f64)i1) * weight;
  }
}

} // namespace multirender
