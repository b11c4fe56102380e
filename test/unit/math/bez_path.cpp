#include <multirender/math/bez_path.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include <vector>

using namespace multirender;

namespace {

std::vector<PathElement> flatten(const BezPath& path, f64 tolerance) {
  std::vector<PathElement> elements{};
  path.Flatten(tolerance, [&](const PathElement& element) { elements.push_back(element); });
  return elements;
}

} // anonymous namespace

TEST(BezPath, LineToWithoutMoveToStartsSubpath) {
  BezPath path{};
  path.LineTo({1.0, 2.0});
  path.ClosePath();

  ASSERT_EQ(path.Elements().size(), 2u);
  EXPECT_EQ(path.Elements()[0].kind, PathElement::Kind::MoveTo);
  EXPECT_EQ(path.Elements()[1].kind, PathElement::Kind::ClosePath);
}

TEST(BezPath, ClosePathOnEmptyPathIsIgnored) {
  BezPath path{};
  path.ClosePath();
  EXPECT_TRUE(path.IsEmpty());
}

TEST(BezPath, FlattenKeepsLinesUntouched) {
  BezPath path{};
  path.MoveTo({0.0, 0.0});
  path.LineTo({10.0, 0.0});
  path.LineTo({10.0, 10.0});
  path.ClosePath();

  EXPECT_EQ(flatten(path, 0.1), path.Elements());
}

TEST(BezPath, FlattenedCubicStaysWithinTolerance) {
  BezPath path{};
  path.MoveTo({0.0, 0.0});
  path.CurveTo({0.0, 100.0}, {100.0, 100.0}, {100.0, 0.0});

  const auto coarse = flatten(path, 10.0);
  const auto fine = flatten(path, 0.01);

  EXPECT_LT(coarse.size(), fine.size());
  EXPECT_EQ(fine.back().points[0], Point(100.0, 0.0));

  // The apex of this symmetric curve is at (50, 75).
  f64 max_y = 0.0;
  for(const PathElement& element : fine) {
    EXPECT_NE(element.kind, PathElement::Kind::CurveTo);
    max_y = std::max(max_y, element.points[0].y);
  }
  EXPECT_NEAR(max_y, 75.0, 0.01);
}

TEST(BezPath, FlattenQuad) {
  BezPath path{};
  path.MoveTo({0.0, 0.0});
  path.QuadTo({50.0, 100.0}, {100.0, 0.0});

  const auto elements = flatten(path, 0.1);
  ASSERT_GT(elements.size(), 2u);
  for(size_t i = 1; i < elements.size(); i++) {
    EXPECT_EQ(elements[i].kind, PathElement::Kind::LineTo);
    EXPECT_LE(elements[i].points[0].y, 50.0 + 1e-9);
  }
}

TEST(BezPath, TransformAndBoundingBox) {
  BezPath path{};
  path.MoveTo({0.0, 0.0});
  path.QuadTo({5.0, 20.0}, {10.0, 0.0});

  const Rect bounds = path.Transformed(Affine::Translate({1.0, 1.0})).BoundingBox();
  EXPECT_EQ(bounds, Rect(1.0, 1.0, 11.0, 21.0));
}

TEST(BezPath, FlattenCurveWithNaNControlPointEmitsSingleSegment) {
  BezPath path{};
  path.MoveTo({0.0, 0.0});
  path.CurveTo({std::numeric_limits<f64>::quiet_NaN(), 1.0}, {2.0, 1.0}, {3.0, 0.0});

  const auto elements = flatten(path, 0.1);
  ASSERT_EQ(elements.size(), 2u);
  EXPECT_EQ(elements[1].kind, PathElement::Kind::LineTo);
  EXPECT_EQ(elements[1].points[0], Point(3.0, 0.0));
}
