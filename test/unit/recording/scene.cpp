#include <multirender/math/ellipse.hpp>
#include <multirender/math/rect.hpp>
#include <multirender/recording/scene.hpp>
#include <gtest/gtest.h>
#include <array>

using namespace multirender;

namespace {

void draw_sample(PaintScene& scene) {
  scene.PushLayer(Mix::Multiply, 0.5f, Affine::Translate({1.0, 2.0}), Rect{0.0, 0.0, 10.0, 10.0});
  scene.Fill(FillRule::EvenOdd, Affine{}, Paint{palette::css::RED}, std::nullopt, Circle{{5.0, 5.0}, 3.0});
  scene.Stroke(StrokeStyle{2.0}, Affine::Scale(2.0), Paint{palette::css::BLUE}, Affine::Translate({1.0, 0.0}), Rect{1.0, 1.0, 4.0, 4.0});
  scene.PopLayer();
  scene.DrawBoxShadow(Affine{}, {0.0, 0.0, 5.0, 5.0}, palette::css::BLACK, 2.0, 1.5);
}

} // anonymous namespace

TEST(Scene, RecordsCommandsInOrder) {
  Scene scene{};
  draw_sample(scene);

  const auto& commands = scene.GetCommands();
  ASSERT_EQ(commands.size(), 5u);
  EXPECT_TRUE(std::holds_alternative<LayerCommand>(commands[0]));
  EXPECT_TRUE(std::holds_alternative<FillCommand>(commands[1]));
  EXPECT_TRUE(std::holds_alternative<StrokeCommand>(commands[2]));
  EXPECT_TRUE(std::holds_alternative<PopLayerCommand>(commands[3]));
  EXPECT_TRUE(std::holds_alternative<BoxShadowCommand>(commands[4]));

  const auto& layer = std::get<LayerCommand>(commands[0]);
  EXPECT_EQ(layer.blend, BlendMode(Mix::Multiply, Compose::SrcOver));
  EXPECT_FLOAT_EQ(layer.alpha, 0.5f);
  EXPECT_EQ(layer.clip.ToSvg(), "M0 0 L10 0 L10 10 L0 10 Z");

  const auto& fill = std::get<FillCommand>(commands[1]);
  EXPECT_EQ(fill.fill, FillRule::EvenOdd);
  EXPECT_EQ(fill.shape, Circle({5.0, 5.0}, 3.0).ToPath(k_default_tolerance));
  EXPECT_FALSE(fill.brush_transform.has_value());

  const auto& stroke = std::get<StrokeCommand>(commands[2]);
  EXPECT_DOUBLE_EQ(stroke.style.width, 2.0);
  ASSERT_TRUE(stroke.brush_transform.has_value());
  EXPECT_EQ(*stroke.brush_transform, Affine::Translate({1.0, 0.0}));
}

TEST(Scene, ReplayReproducesRecording) {
  Scene scene{};
  draw_sample(scene);

  Scene copy{};
  scene.RenderTo(copy);
  EXPECT_EQ(copy.GetCommands(), scene.GetCommands());

  // Replaying twice appends a second copy.
  scene.RenderTo(copy);
  EXPECT_EQ(copy.GetCommands().size(), 10u);
}

TEST(Scene, RecordsGlyphRuns) {
  Scene scene{};
  const FontData font{Blob::Create({0, 1, 2, 3}), 1u};
  const std::array<Glyph, 2> glyphs{Glyph{1u, 0.0f, 10.0f}, Glyph{2u, 8.0f, 10.0f}};
  const std::array<NormalizedCoord, 1> coords{NormalizedCoord{8192}};

  scene.DrawGlyphs(font, 16.0f, true, coords, FillRule::NonZero, palette::css::BLACK, 0.75f, Affine{}, std::nullopt, glyphs);

  ASSERT_EQ(scene.GetCommands().size(), 1u);
  const auto& run = std::get<GlyphRunCommand>(scene.GetCommands()[0]);
  EXPECT_EQ(run.font, font);
  EXPECT_FLOAT_EQ(run.font_size, 16.0f);
  EXPECT_TRUE(run.hint);
  EXPECT_EQ(run.normalized_coords, std::vector<NormalizedCoord>{8192});
  ASSERT_EQ(run.glyphs.size(), 2u);
  EXPECT_EQ(run.glyphs[1], glyphs[1]);
  EXPECT_FLOAT_EQ(run.brush_alpha, 0.75f);
}

TEST(Scene, AppendAppliesTransform) {
  Scene inner{};
  inner.Fill(FillRule::NonZero, Affine::Scale(2.0), Paint{palette::css::RED}, Affine::Scale(3.0), Rect{0.0, 0.0, 1.0, 1.0});
  inner.PopLayer();

  Scene outer{};
  outer.Append(inner);
  outer.Append(inner, Affine::Translate({10.0, 0.0}));

  ASSERT_EQ(outer.GetCommands().size(), 4u);
  EXPECT_EQ(outer.GetCommands()[0], inner.GetCommands()[0]);

  const auto& moved = std::get<FillCommand>(outer.GetCommands()[2]);
  EXPECT_EQ(moved.transform, Affine::Translate({10.0, 0.0}) * Affine::Scale(2.0));
  EXPECT_EQ(moved.brush_transform, Affine::Scale(3.0));
}

TEST(Scene, AppendToItselfDuplicatesCommands) {
  Scene scene{};
  scene.Fill(FillRule::NonZero, Affine{}, Paint{palette::css::RED}, std::nullopt, Rect{0.0, 0.0, 1.0, 1.0});
  scene.PopLayer();

  scene.Append(scene, Affine::Scale(2.0));
  scene.Append(scene);

  ASSERT_EQ(scene.GetCommands().size(), 8u);
  EXPECT_EQ(std::get<FillCommand>(scene.GetCommands()[0]).transform, Affine{});
  EXPECT_EQ(std::get<FillCommand>(scene.GetCommands()[2]).transform, Affine::Scale(2.0));
  EXPECT_EQ(std::get<FillCommand>(scene.GetCommands()[6]).transform, Affine::Scale(2.0));
  EXPECT_TRUE(std::holds_alternative<PopLayerCommand>(scene.GetCommands()[7]));
}

TEST(Scene, DrawImageRecordsImageFill) {
  const auto image = ImageData::Create(std::vector<u8>(4u * 6u), ImageFormat::Rgba8, ImageAlphaType::Alpha, 3u, 2u);
  ASSERT_TRUE(image.has_value());

  Scene scene{};
  scene.DrawImage(ImageBrush{*image}, Affine{});

  ASSERT_EQ(scene.GetCommands().size(), 1u);
  const auto& fill = std::get<FillCommand>(scene.GetCommands()[0]);
  EXPECT_TRUE(std::holds_alternative<ImageBrush>(fill.paint));
  EXPECT_EQ(fill.shape.BoundingBox(), Rect(0.0, 0.0, 3.0, 2.0));
}

TEST(Scene, ResetClearsCommands) {
  Scene scene{0.5};
  draw_sample(scene);
  scene.Reset();

  EXPECT_TRUE(scene.IsEmpty());
  EXPECT_DOUBLE_EQ(scene.GetTolerance(), 0.5);
}
