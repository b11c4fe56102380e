#include <multirender/math/bez_path.hpp>
#include <multirender/math/ellipse.hpp>
#include <multirender/math/line.hpp>
#include <multirender/math/rect.hpp>
#include <multirender/math/rounded_rect.hpp>
#include <gtest/gtest.h>
#include <numbers>

using namespace multirender;

TEST(Rect, NormalizesAndIntersects) {
  const Rect rect = Rect::FromPoints({10.0, 10.0}, {0.0, 0.0});
  EXPECT_EQ(rect, Rect(0.0, 0.0, 10.0, 10.0));
  EXPECT_DOUBLE_EQ(rect.Area(), 100.0);

  EXPECT_EQ(rect.Intersect({5.0, 5.0, 20.0, 20.0}), Rect(5.0, 5.0, 10.0, 10.0));
  EXPECT_TRUE(rect.Intersect({20.0, 20.0, 30.0, 30.0}).IsEmpty());
  EXPECT_EQ(rect.Union({20.0, 20.0, 30.0, 30.0}), Rect(0.0, 0.0, 30.0, 30.0));
}

TEST(Rect, PathIsClosedQuad) {
  const BezPath path = Rect{0.0, 0.0, 4.0, 2.0}.ToPath(k_default_tolerance);
  EXPECT_EQ(path.ToSvg(), "M0 0 L4 0 L4 2 L0 2 Z");
}

TEST(RoundedRect, RadiiAreClampedToHalfTheShorterSide) {
  const RoundedRect rounded_rect{{0.0, 0.0, 100.0, 20.0}, 50.0};
  EXPECT_EQ(rounded_rect.GetRadii(), RoundedRectRadii(10.0));
}

TEST(RoundedRect, ZeroRadiiProduceRectangle) {
  const RoundedRect rounded_rect{{0.0, 0.0, 4.0, 2.0}, 0.0};
  EXPECT_EQ(rounded_rect.ToPath(k_default_tolerance).ToSvg(), "M0 0 L4 0 L4 2 L0 2 L0 0 Z");
}

TEST(RoundedRect, CornersAreCubic) {
  const RoundedRect rounded_rect{{0.0, 0.0, 10.0, 10.0}, {1.0, 2.0, 3.0, 4.0}};
  const BezPath path = rounded_rect.ToPath(k_default_tolerance);

  size_t curves = 0u;
  for(const PathElement& element : path.Elements()) {
    curves += element.kind == PathElement::Kind::CurveTo ? 1u : 0u;
  }
  EXPECT_EQ(curves, 4u);
  EXPECT_EQ(path.BoundingBox(), Rect(0.0, 0.0, 10.0, 10.0));
}

TEST(Circle, PathPassesThroughCardinalPoints) {
  const BezPath path = Circle{{5.0, 5.0}, 2.0}.ToPath(k_default_tolerance);
  const auto& elements = path.Elements();

  ASSERT_EQ(elements.size(), 6u);
  EXPECT_EQ(elements[0].points[0], Point(7.0, 5.0));
  EXPECT_EQ(elements[1].points[2], Point(5.0, 7.0));
  EXPECT_EQ(elements[2].points[2], Point(3.0, 5.0));
  EXPECT_EQ(elements[3].points[2], Point(5.0, 3.0));
  EXPECT_EQ(elements[5].kind, PathElement::Kind::ClosePath);
}

TEST(Ellipse, RotatedBoundingBox) {
  const Ellipse ellipse{{0.0, 0.0}, {4.0, 1.0}, std::numbers::pi / 2.0};
  const Rect bounds = ellipse.BoundingBox();

  EXPECT_NEAR(bounds.x0, -1.0, 1e-9);
  EXPECT_NEAR(bounds.x1, 1.0, 1e-9);
  EXPECT_NEAR(bounds.y0, -4.0, 1e-9);
  EXPECT_NEAR(bounds.y1, 4.0, 1e-9);
}

TEST(Line, IsOpenPath) {
  const Line line{{1.0, 1.0}, {4.0, 5.0}};
  EXPECT_DOUBLE_EQ(line.Length(), 5.0);
  EXPECT_EQ(line.ToPath(k_default_tolerance).ToSvg(), "M1 1 L4 5");
}
