#pragma once

#include <multirender/math/bez_path.hpp>
#include <multirender/math/stroke.hpp>
#include <multirender/float.hpp>

namespace multirender {

/**
 * Converts the outline of `path` stroked with `style` into a polygon path that covers the stroke
 * when filled with the NonZero rule. Every emitted polygon is positively oriented, so overlapping
 * segments, joins and caps never cancel each other out.
 *
 * @param tolerance maximum distance between curves (including round joins and caps) and their flattened form
 */
BezPath stroke_to_fill_path(const BezPath& path, const StrokeStyle& style, f64 tolerance);

} // namespace multirender
