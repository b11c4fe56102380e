#include <multirender/math/bez_path.hpp>
#include <gtest/gtest.h>

using namespace multirender;

TEST(SvgPath, PrintsAbsoluteCommands) {
  BezPath path{};
  path.MoveTo({0.0, 0.0});
  path.LineTo({10.0, 0.5});
  path.QuadTo({1.0, 2.0}, {3.0, 4.0});
  path.CurveTo({1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0});
  path.ClosePath();

  EXPECT_EQ(path.ToSvg(), "M0 0 L10 0.5 Q1 2 3 4 C1 2 3 4 5 6 Z");
}

TEST(SvgPath, ParsesAbsoluteCommands) {
  const auto path = BezPath::FromSvg("M0 0 L10 0.5 Q1 2 3 4 C1 2 3 4 5 6 Z");
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->ToSvg(), "M0 0 L10 0.5 Q1 2 3 4 C1 2 3 4 5 6 Z");
}

TEST(SvgPath, ParsesRelativeAndShorthandCommands) {
  const auto path = BezPath::FromSvg("m10,10 h5 v5 l-5,0 z M1 1 2 2");
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->ToSvg(), "M10 10 L15 10 L15 15 L10 15 Z M1 1 L2 2");
}

TEST(SvgPath, RejectsMalformedInput) {
  EXPECT_FALSE(BezPath::FromSvg("M0").has_value());
  EXPECT_FALSE(BezPath::FromSvg("10 10").has_value());
  EXPECT_FALSE(BezPath::FromSvg("M0 0 X1 1").has_value());
  EXPECT_FALSE(BezPath::FromSvg("M0 0 C1 1 2 2").has_value());
}

TEST(SvgPath, EmptyInputIsEmptyPath) {
  const auto path = BezPath::FromSvg("  ");
  ASSERT_TRUE(path.has_value());
  EXPECT_TRUE(path->IsEmpty());
}
