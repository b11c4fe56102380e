#pragma once

#include <multirender/cpu/mask.hpp>
#include <multirender/math/affine.hpp>
#include <multirender/math/bez_path.hpp>
#include <multirender/paint/style.hpp>
#include <multirender/float.hpp>
#include <multirender/integer.hpp>
#include <span>
#include <vector>

namespace multirender {

/**
 * Scan converts polygons into coverage masks. Each pixel row is sampled at four sub-scanlines,
 * along a sub-scanline the covered spans are integrated exactly.
 */
class Rasterizer {
  public:
    static constexpr int k_sub_scanlines = 4;

    Rasterizer() = default;
    Rasterizer(u32 width, u32 height) : m_width{width}, m_height{height} {}

    void Resize(u32 width, u32 height) {
      m_width = width;
      m_height = height;
    }

    /// Removes all edges.
    void Reset() {
      m_edges.clear();
    }

    [[nodiscard]] bool IsEmpty() const {
      return m_edges.empty();
    }

    /**
     * Flattens `path` after transforming it into device space and adds its edges.
     * Open subpaths are closed implicitly.
     */
    void AddPath(const BezPath& path, const Affine& transform, f64 tolerance);

    /// Adds a single edge in device space. Horizontal edges are discarded.
    void AddLine(const Point& p0, const Point& p1);

    /// Computes the coverage of all edges added since the last Reset() into `mask`.
    void Rasterize(FillRule fill_rule, Mask& mask);

  private:
    struct Edge {
      f64 x0;
      f64 y0;
      f64 x1;
      f64 y1;
      f64 dxdy;
      int winding;
    };

    struct Crossing {
      f64 x;
      int winding;
    };

    static void AccumulateSpan(std::span<f32> row, f64 x0, f64 x1, f32 weight);

    u32 m_width{};
    u32 m_height{};
    std::vector<Edge> m_edges{};
    std::vector<Crossing> m_crossings{};
    std::vector<size_t> m_active_edges{};
};

} // namespace multirender
