#include <multirender/cpu/rasterizer.hpp>
#include <multirender/cpu/stroker.hpp>
#include <multirender/math/rect.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <numbers>

using namespace multirender;

namespace {

class StrokerTest : public ::testing::Test {
  protected:
    /// Strokes the path and returns the covered area (in pixels) within a 16x16 canvas.
    f32 GetStrokedArea(const BezPath& path, const StrokeStyle& style) {
      m_rasterizer.Reset();
      m_rasterizer.AddPath(stroke_to_fill_path(path, style, 0.01), Affine{}, 0.01);
      m_rasterizer.Rasterize(FillRule::NonZero, m_mask);

      f32 sum = 0.0f;
      for(u32 y = 0; y < m_mask.GetHeight(); y++) {
        for(const f32 coverage : m_mask.Row(y)) {
          sum += coverage;
        }
      }
      return sum;
    }

    static BezPath MakeLine(const Point& p0, const Point& p1) {
      BezPath path{};
      path.MoveTo(p0);
      path.LineTo(p1);
      return path;
    }

    Rasterizer m_rasterizer{16u, 16u};
    Mask m_mask{};
};

} // anonymous namespace

TEST_F(StrokerTest, Caps) {
  const BezPath line = MakeLine({4.0, 8.0}, {10.0, 8.0});

  EXPECT_NEAR(GetStrokedArea(line, StrokeStyle{2.0}.WithCaps(Cap::Butt)), 12.0f, 1e-3f);
  EXPECT_NEAR(GetStrokedArea(line, StrokeStyle{2.0}.WithCaps(Cap::Square)), 16.0f, 1e-3f);
  EXPECT_NEAR(GetStrokedArea(line, StrokeStyle{2.0}.WithCaps(Cap::Round)), 12.0f + std::numbers::pi_v<f32>, 0.2f);
}

TEST_F(StrokerTest, ButtCappedLineCoversExpectedPixels) {
  GetStrokedArea(MakeLine({0.0, 8.0}, {16.0, 8.0}), StrokeStyle{2.0}.WithCaps(Cap::Butt));

  EXPECT_FLOAT_EQ(m_mask.At(5, 7), 1.0f);
  EXPECT_FLOAT_EQ(m_mask.At(5, 8), 1.0f);
  EXPECT_FLOAT_EQ(m_mask.At(5, 6), 0.0f);
  EXPECT_FLOAT_EQ(m_mask.At(5, 9), 0.0f);
}

TEST_F(StrokerTest, Joins) {
  const BezPath square = Rect{4.0, 4.0, 12.0, 12.0}.ToPath(k_default_tolerance);

  // Outer square 10x10 minus the inner 6x6 hole.
  EXPECT_NEAR(GetStrokedArea(square, StrokeStyle{2.0}.WithJoin(Join::Miter)), 64.0f, 1e-3f);
  EXPECT_NEAR(GetStrokedArea(square, StrokeStyle{2.0}.WithJoin(Join::Bevel)), 62.0f, 1e-3f);
  EXPECT_NEAR(GetStrokedArea(square, StrokeStyle{2.0}.WithJoin(Join::Round)), 60.0f + std::numbers::pi_v<f32>, 0.2f);

  // The interior of the square stays empty.
  EXPECT_FLOAT_EQ(m_mask.At(8, 8), 0.0f);
}

TEST_F(StrokerTest, MiterLimitFallsBackToBevel) {
  const BezPath square = Rect{4.0, 4.0, 12.0, 12.0}.ToPath(k_default_tolerance);

  // A right angle needs a miter limit of at least sqrt(2).
  EXPECT_NEAR(GetStrokedArea(square, StrokeStyle{2.0}.WithJoin(Join::Miter).WithMiterLimit(1.2)), 62.0f, 1e-3f);
}

TEST_F(StrokerTest, Dashes) {
  const BezPath line = MakeLine({0.0, 8.0}, {8.0, 8.0});

  StrokeStyle style = StrokeStyle{2.0}.WithCaps(Cap::Butt).WithDashes(0.0, {2.0, 2.0});
  EXPECT_NEAR(GetStrokedArea(line, style), 8.0f, 1e-3f);
  EXPECT_FLOAT_EQ(m_mask.At(1, 7), 1.0f);
  EXPECT_FLOAT_EQ(m_mask.At(3, 7), 0.0f);
  EXPECT_FLOAT_EQ(m_mask.At(5, 7), 1.0f);

  // An odd pattern is repeated, {2} behaves like {2, 2}.
  style.WithDashes(0.0, {2.0});
  EXPECT_NEAR(GetStrokedArea(line, style), 8.0f, 1e-3f);

  // The offset shifts the pattern along the path.
  style.WithDashes(2.0, {2.0, 2.0});
  GetStrokedArea(line, style);
  EXPECT_FLOAT_EQ(m_mask.At(1, 7), 0.0f);
  EXPECT_FLOAT_EQ(m_mask.At(3, 7), 1.0f);
}

TEST_F(StrokerTest, InvalidDashPatternsDrawSolidStroke) {
  const BezPath line = MakeLine({0.0, 8.0}, {8.0, 8.0});

  EXPECT_NEAR(GetStrokedArea(line, StrokeStyle{2.0}.WithCaps(Cap::Butt).WithDashes(0.0, {0.0, 0.0})), 16.0f, 1e-3f);
  EXPECT_NEAR(GetStrokedArea(line, StrokeStyle{2.0}.WithCaps(Cap::Butt).WithDashes(0.0, {2.0, -1.0})), 16.0f, 1e-3f);
}

TEST_F(StrokerTest, ZeroLengthSubpathDrawsCaps) {
  const BezPath dot = MakeLine({8.0, 8.0}, {8.0, 8.0});

  EXPECT_NEAR(GetStrokedArea(dot, StrokeStyle{4.0}.WithCaps(Cap::Round)), 4.0f * std::numbers::pi_v<f32>, 0.3f);
  EXPECT_NEAR(GetStrokedArea(dot, StrokeStyle{4.0}.WithCaps(Cap::Square)), 16.0f, 1e-3f);
  EXPECT_TRUE(stroke_to_fill_path(dot, StrokeStyle{4.0}.WithCaps(Cap::Butt), 0.1).IsEmpty());
}

TEST_F(StrokerTest, NonPositiveWidthDrawsNothing) {
  const BezPath line = MakeLine({0.0, 8.0}, {8.0, 8.0});

  EXPECT_TRUE(stroke_to_fill_path(line, StrokeStyle{0.0}, 0.1).IsEmpty());
  EXPECT_TRUE(stroke_to_fill_path(line, StrokeStyle{-1.0}, 0.1).IsEmpty());
  EXPECT_TRUE(stroke_to_fill_path(line, StrokeStyle{NAN}, 0.1).IsEmpty());
}

TEST_F(StrokerTest, OverlappingSegmentsDoNotCancel) {
  BezPath path{};
  path.MoveTo({2.0, 8.0});
  path.LineTo({12.0, 8.0});
  path.LineTo({4.0, 8.0});

  GetStrokedArea(path, StrokeStyle{2.0}.WithCaps(Cap::Butt));
  EXPECT_FLOAT_EQ(m_mask.At(6, 7), 1.0f);
  EXPECT_FLOAT_EQ(m_mask.At(6, 8), 1.0f);
}
