#pragma once

#include <multirender/float.hpp>

namespace multirender {

class BezPath;
struct Rect;

/// Tolerance used when converting shapes into paths for rendering.
constexpr f64 k_default_tolerance = 0.1;

/**
 * Interface for anything that can be described by a Bézier path.
 */
class Shape {
  public:
    virtual ~Shape() = default;

    /**
     * Converts the shape into a path. Curved shapes are approximated by cubic Bézier segments,
     * `tolerance` bounds the approximation error where one is introduced.
     */
    [[nodiscard]] virtual BezPath ToPath(f64 tolerance) const = 0;

    /// @returns a rectangle that fully encloses the shape
    [[nodiscard]] virtual Rect BoundingBox() const = 0;
};

} // namespace multirender
