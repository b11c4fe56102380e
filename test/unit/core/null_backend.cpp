#include <multirender/math/rect.hpp>
#include <multirender/null_backend.hpp>
#include <gtest/gtest.h>
#include <vector>

using namespace multirender;

TEST(NullImageRenderer, RendersTransparentFrames) {
  NullImageRenderer renderer{4u, 2u};
  int draw_calls = 0;

  std::vector<u8> buffer(32u, 0xFFu);
  const bool success = renderer.Render([&](PaintScene& scene) {
    scene.Fill(FillRule::NonZero, Affine{}, Paint{palette::css::RED}, std::nullopt, Rect{0.0, 0.0, 4.0, 2.0});
    draw_calls++;
  }, buffer);

  EXPECT_TRUE(success);
  EXPECT_EQ(draw_calls, 1);
  EXPECT_EQ(buffer, std::vector<u8>(32u, 0u));
}

TEST(NullImageRenderer, RejectsWrongBufferSize) {
  NullImageRenderer renderer{4u, 2u};
  std::vector<u8> buffer(31u, 0xFFu);

  EXPECT_FALSE(renderer.Render([](PaintScene&) {}, buffer));
  EXPECT_EQ(buffer, std::vector<u8>(31u, 0xFFu));
}

TEST(NullImageRenderer, RenderToVectorResizes) {
  NullImageRenderer renderer{1u, 1u};
  renderer.Resize(3u, 3u);

  std::vector<u8> buffer{};
  EXPECT_TRUE(renderer.RenderToVector([](PaintScene&) {}, buffer));
  EXPECT_EQ(buffer.size(), 36u);
}

TEST(NullWindowRenderer, OnlyRendersWhileActive) {
  NullWindowRenderer renderer{};
  int draw_calls = 0;
  const DrawFn draw_fn = [&](PaintScene&) { draw_calls++; };

  renderer.Render(draw_fn);
  EXPECT_FALSE(renderer.IsActive());
  EXPECT_EQ(draw_calls, 0);

  renderer.Resume(nullptr, 100u, 100u);
  renderer.Render(draw_fn);
  renderer.Render(draw_fn);
  EXPECT_TRUE(renderer.IsActive());
  EXPECT_EQ(renderer.GetNumberOfRenderedFrames(), 2u);

  renderer.Suspend();
  renderer.Render(draw_fn);
  EXPECT_EQ(draw_calls, 2);
}
