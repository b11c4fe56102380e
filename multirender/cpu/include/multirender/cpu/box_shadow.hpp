#pragma once

#include <multirender/math/point.hpp>
#include <multirender/math/rect.hpp>
#include <multirender/float.hpp>

namespace multirender {

/**
 * Evaluates the opacity of a rounded rectangle blurred with a Gaussian of standard deviation `std_dev`
 * at `point`. The blur along x is integrated exactly with erf, along y it is integrated numerically.
 *
 * @param radius corner radius, clamped to half of the shorter side
 */
f32 evaluate_box_shadow(const Point& point, const Rect& rect, f64 radius, f64 std_dev);

} // namespace multirender
