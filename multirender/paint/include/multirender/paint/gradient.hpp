#pragma once

#include <multirender/math/point.hpp>
#include <multirender/paint/color.hpp>
#include <multirender/float.hpp>
#include <variant>
#include <vector>

namespace multirender {

/// Defines what happens to a paint outside of its natural bounds.
enum class Extend : u8 {
  /// Repeat the edge color or pixel.
  Pad,
  /// Tile the paint.
  Repeat,
  /// Tile the paint, mirroring every other tile.
  Reflect
};

/// Maps `t` into the range [0, 1] according to the extend mode.
f32 apply_extend(f32 t, Extend extend);

struct ColorStop {
  f32 offset{};
  Color color{};

  bool operator==(const ColorStop& other) const = default;
};

struct LinearGradientPosition {
  Point start{};
  Point end{};

  bool operator==(const LinearGradientPosition& other) const = default;
};

/// Two point conical gradient. A simple radial gradient has coinciding centers and a zero start radius.
struct RadialGradientPosition {
  Point start_center{};
  f32 start_radius{};
  Point end_center{};
  f32 end_radius{};

  bool operator==(const RadialGradientPosition& other) const = default;
};

/// Angles are given in radians, measured clockwise from the positive x axis in a y-down coordinate system.
struct SweepGradientPosition {
  Point center{};
  f32 start_angle{};
  f32 end_angle{};

  bool operator==(const SweepGradientPosition& other) const = default;
};

using GradientKind = std::variant<LinearGradientPosition, RadialGradientPosition, SweepGradientPosition>;

class Gradient {
  public:
    Gradient() = default;
    explicit Gradient(GradientKind kind) : m_kind{kind} {}

    static Gradient NewLinear(const Point& start, const Point& end) {
      return Gradient{LinearGradientPosition{start, end}};
    }

    static Gradient NewRadial(const Point& center, f32 radius) {
      return Gradient{RadialGradientPosition{center, 0.0f, center, radius}};
    }

    static Gradient NewTwoPointRadial(const Point& start_center, f32 start_radius, const Point& end_center, f32 end_radius) {
      return Gradient{RadialGradientPosition{start_center, start_radius, end_center, end_radius}};
    }

    static Gradient NewSweep(const Point& center, f32 start_angle, f32 end_angle) {
      return Gradient{SweepGradientPosition{center, start_angle, end_angle}};
    }

    /// Replaces the color stops. Stops are kept ordered by offset, stops with equal offsets keep their order.
    Gradient& WithStops(std::vector<ColorStop> stops);

    /// Replaces the color stops with evenly spaced stops of the given colors.
    Gradient& WithColors(const std::vector<Color>& colors);

    Gradient& WithExtend(Extend extend) {
      m_extend = extend;
      return *this;
    }

    [[nodiscard]] const GradientKind& GetKind() const {
      return m_kind;
    }

    [[nodiscard]] Extend GetExtend() const {
      return m_extend;
    }

    [[nodiscard]] const std::vector<ColorStop>& GetStops() const {
      return m_stops;
    }

    /**
     * Evaluates the color ramp at `t`, which must already be mapped by the extend mode.
     * An empty ramp is transparent, a ramp with a single stop is a solid color.
     */
    [[nodiscard]] Color Evaluate(f32 t) const;

    bool operator==(const Gradient& other) const = default;

  private:
    GradientKind m_kind{LinearGradientPosition{}};
    Extend m_extend{Extend::Pad};
    std::vector<ColorStop> m_stops{};
};

} // namespace multirender
