#pragma once

#include <multirender/math/point.hpp>
#include <multirender/float.hpp>
#include <array>

namespace multirender {

struct Rect;

/**
 * A 2D affine transform stored as the six coefficients [a b c d e f] of the matrix
 *   | a c e |
 *   | b d f |
 *   | 0 0 1 |
 * so that a point is mapped to (a*x + c*y + e, b*x + d*y + f).
 */
class Affine {
  public:
    Affine() = default;

    explicit Affine(const std::array<f64, 6>& coefficients) : m_coefficients{coefficients} {}

    static Affine Identity() {
      return {};
    }

    static Affine Translate(const Vec2& offset) {
      return Affine{{1.0, 0.0, 0.0, 1.0, offset.x, offset.y}};
    }

    static Affine Scale(f64 scale) {
      return Affine{{scale, 0.0, 0.0, scale, 0.0, 0.0}};
    }

    static Affine ScaleNonUniform(f64 scale_x, f64 scale_y) {
      return Affine{{scale_x, 0.0, 0.0, scale_y, 0.0, 0.0}};
    }

    /// Rotation by the given angle in radians. Positive angles rotate clockwise in a y-down coordinate system.
    static Affine Rotate(f64 angle);

    static Affine RotateAbout(f64 angle, const Point& center);

    static Affine Skew(f64 skew_x, f64 skew_y) {
      return Affine{{1.0, skew_y, skew_x, 1.0, 0.0, 0.0}};
    }

    [[nodiscard]] const std::array<f64, 6>& Coefficients() const {
      return m_coefficients;
    }

    [[nodiscard]] f64 Determinant() const {
      return m_coefficients[0] * m_coefficients[3] - m_coefficients[1] * m_coefficients[2];
    }

    /// @returns the inverse transform. A singular transform yields a transform that maps everything onto the origin.
    [[nodiscard]] Affine Inverse() const;

    [[nodiscard]] Vec2 GetTranslation() const {
      return {m_coefficients[4], m_coefficients[5]};
    }

    [[nodiscard]] Affine WithTranslation(const Vec2& translation) const {
      return Affine{{m_coefficients[0], m_coefficients[1], m_coefficients[2], m_coefficients[3], translation.x, translation.y}};
    }

    /// @returns the transform that first applies this transform and then translates by the given offset
    [[nodiscard]] Affine ThenTranslate(const Vec2& offset) const {
      return Translate(offset) * *this;
    }

    /// @returns the transform that first applies this transform and then scales by the given factor
    [[nodiscard]] Affine ThenScale(f64 scale) const {
      return Scale(scale) * *this;
    }

    /// @returns the transform that first applies this transform and then rotates by the given angle
    [[nodiscard]] Affine ThenRotate(f64 angle) const {
      return Rotate(angle) * *this;
    }

    [[nodiscard]] Point Apply(const Point& point) const {
      return {
        m_coefficients[0] * point.x + m_coefficients[2] * point.y + m_coefficients[4],
        m_coefficients[1] * point.x + m_coefficients[3] * point.y + m_coefficients[5]
      };
    }

    /// Transforms a direction, ignoring the translation part.
    [[nodiscard]] Vec2 ApplyToVector(const Vec2& vec) const {
      return {
        m_coefficients[0] * vec.x + m_coefficients[2] * vec.y,
        m_coefficients[1] * vec.x + m_coefficients[3] * vec.y
      };
    }

    /// @returns the axis-aligned bounding box of the transformed rectangle
    [[nodiscard]] Rect TransformRectBoundingBox(const Rect& rect) const;

    /// @returns true if all coefficients are finite numbers
    [[nodiscard]] bool IsFinite() const;

    /// Composition: (lhs * rhs) applies rhs first, then lhs.
    Affine operator*(const Affine& other) const;

    Point operator*(const Point& point) const {
      return Apply(point);
    }

    bool operator==(const Affine& other) const = default;

  private:
    std::array<f64, 6> m_coefficients{1.0, 0.0, 0.0, 1.0, 0.0, 0.0};
};

} // namespace multirender
