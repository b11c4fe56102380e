#pragma once

#include <multirender/math/affine.hpp>
#include <multirender/math/point.hpp>
#include <multirender/math/rect.hpp>
#include <multirender/math/shape.hpp>
#include <multirender/float.hpp>
#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace multirender {

struct PathElement {
  enum class Kind {
    MoveTo,
    LineTo,
    QuadTo,
    CurveTo,
    ClosePath
  };

  /// @returns the number of points stored for an element of the given kind
  static constexpr size_t GetNumberOfPoints(Kind kind) {
    switch(kind) {
      case Kind::MoveTo:
      case Kind::LineTo: return 1u;
      case Kind::QuadTo: return 2u;
      case Kind::CurveTo: return 3u;
      case Kind::ClosePath: return 0u;
    }
    return 0u;
  }

  Kind kind{Kind::MoveTo};
  std::array<Point, 3> points{};

  bool operator==(const PathElement& other) const = default;
};

/**
 * A path built from move, line, quadratic and cubic Bézier and close commands.
 */
class BezPath final : public Shape {
  public:
    BezPath() = default;
    explicit BezPath(std::vector<PathElement> elements) : m_elements{std::move(elements)} {}

    void MoveTo(const Point& p);
    void LineTo(const Point& p);
    void QuadTo(const Point& p1, const Point& p2);
    void CurveTo(const Point& p1, const Point& p2, const Point& p3);
    void ClosePath();

    void Clear() {
      m_elements.clear();
    }

    void Append(const BezPath& other) {
      m_elements.insert(m_elements.end(), other.m_elements.begin(), other.m_elements.end());
    }

    [[nodiscard]] bool IsEmpty() const {
      return m_elements.empty();
    }

    [[nodiscard]] const std::vector<PathElement>& Elements() const {
      return m_elements;
    }

    void ApplyAffine(const Affine& affine);

    [[nodiscard]] BezPath Transformed(const Affine& affine) const {
      BezPath path = *this;
      path.ApplyAffine(affine);
      return path;
    }

    /**
     * Approximates the path by line segments. The callback receives MoveTo, LineTo and ClosePath
     * elements only. Curves are subdivided so that no point of a segment is further than
     * `tolerance` away from the curve.
     */
    void Flatten(f64 tolerance, const std::function<void(const PathElement&)>& callback) const;

    /// Serializes the path as SVG path data using absolute commands.
    [[nodiscard]] std::string ToSvg() const;

    /// Parses SVG path data (M, L, H, V, Q, C, Z in both absolute and relative form).
    static std::optional<BezPath> FromSvg(std::string_view svg);

    [[nodiscard]] BezPath ToPath(f64 tolerance) const override {
      return *this;
    }

    /// @returns the bounding box of all points, including control points
    [[nodiscard]] Rect BoundingBox() const override;

    bool operator==(const BezPath& other) const {
      return m_elements == other.m_elements;
    }

  private:
    std::vector<PathElement> m_elements{};
};

} // namespace multirender
