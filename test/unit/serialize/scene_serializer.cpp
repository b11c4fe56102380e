#include <multirender/math/ellipse.hpp>
#include <multirender/math/rect.hpp>
#include <multirender/math/rounded_rect.hpp>
#include <multirender/serialize/scene_archive.hpp>
#include <gtest/gtest.h>
#include <array>
#include <vector>
#include <numbers>

using namespace multirender;

namespace {

Scene make_scene_without_resources() {
  Scene scene{0.25};

  scene.PushLayer({Mix::Screen, Compose::SrcAtop}, 0.75f, Affine::Rotate(0.5), RoundedRect{{0.0, 0.0, 50.0, 40.0}, 8.0});
  scene.Fill(FillRule::EvenOdd, Affine::Translate({3.0, 4.0}), Paint{Color{0.1f, 0.2f, 0.3f, 0.4f}}, std::nullopt, Circle{{10.0, 10.0}, 5.5});

  Gradient gradient = Gradient::NewTwoPointRadial({1.0, 2.0}, 0.5f, {3.0, 4.0}, 20.0f);
  gradient.WithExtend(Extend::Reflect).WithColors({palette::css::RED, palette::css::LIME, palette::css::BLUE});
  scene.Stroke(
    StrokeStyle{3.5}.WithJoin(Join::Miter).WithMiterLimit(10.0).WithCaps(Cap::Square).WithDashes(1.0, {4.0, 2.0}),
    Affine::Scale(2.0), Paint{gradient}, Affine::Skew(0.1, 0.0), Ellipse{{20.0, 20.0}, {10.0, 5.0}, std::numbers::pi / 6.0});

  scene.PushClipLayer(Affine{}, Rect{0.0, 0.0, 10.0, 10.0});
  scene.Fill(FillRule::NonZero, Affine{}, Paint{Gradient::NewSweep({5.0, 5.0}, 0.0f, 3.0f).WithColors({palette::css::WHITE})}, std::nullopt, Rect{0.0, 0.0, 10.0, 10.0});
  scene.Fill(FillRule::NonZero, Affine{}, Paint{CustomPaint{7u, 64u, 32u, 2.0}}, std::nullopt, Rect{0.0, 0.0, 64.0, 32.0});
  scene.PopLayer();
  scene.PopLayer();

  scene.DrawBoxShadow(Affine::Translate({5.0, 5.0}), {0.0, 0.0, 30.0, 20.0}, palette::css::BLACK.WithAlpha(0.5f), 4.0, 2.5);
  return scene;
}

} // anonymous namespace

TEST(SceneSerializer, DocumentLayout) {
  const Scene scene = make_scene_without_resources();
  const SceneArchive archive = SceneSerializer{}.Serialize(scene);
  const auto& document = archive.document;

  EXPECT_EQ(document.at("version").get<int>(), SceneArchive::k_format_version);
  EXPECT_DOUBLE_EQ(document.at("tolerance").get<f64>(), 0.25);
  EXPECT_TRUE(document.at("resources").at("images").empty());
  EXPECT_TRUE(document.at("resources").at("fonts").empty());

  const auto& commands = document.at("commands");
  ASSERT_EQ(commands.size(), scene.GetCommands().size());
  EXPECT_EQ(commands[0].at("type"), "push_layer");
  EXPECT_EQ(commands[0].at("blend").at("mix"), "screen");
  EXPECT_EQ(commands[0].at("blend").at("compose"), "src_atop");
  EXPECT_EQ(commands[1].at("fill"), "even_odd");
  EXPECT_TRUE(commands[1].at("brush_transform").is_null());
  EXPECT_EQ(commands[2].at("style").at("join"), "miter");
  EXPECT_EQ(commands[2].at("paint").at("gradient").at("kind").at("type"), "radial");
  EXPECT_EQ(commands[3].at("clip"), "M0 0 L10 0 L10 10 L0 10 Z");
  EXPECT_EQ(commands[5].at("paint").at("type"), "custom");
  EXPECT_EQ(commands[8].at("type"), "box_shadow");
}

TEST(SceneSerializer, RoundTripPreservesCommands) {
  const Scene scene = make_scene_without_resources();
  const SceneArchive archive = SceneSerializer{}.Serialize(scene);

  const std::optional<Scene> restored = SceneDeserializer{}.Deserialize(archive);
  ASSERT_TRUE(restored.has_value());
  EXPECT_DOUBLE_EQ(restored->GetTolerance(), 0.25);
  EXPECT_EQ(restored->GetCommands(), scene.GetCommands());
}

TEST(SceneSerializer, SharedResourcesAreStoredOnce) {
  const auto image = ImageData::Create(std::vector<u8>(16u, 0x80u), ImageFormat::Rgba8, ImageAlphaType::Alpha, 2u, 2u);
  const auto other_image = ImageData::Create(std::vector<u8>(4u, 0xFFu), ImageFormat::Bgra8, ImageAlphaType::AlphaPremultiplied, 1u, 1u);
  ASSERT_TRUE(image.has_value() && other_image.has_value());

  const FontData font{Blob::Create({1, 2, 3, 4}), 0u};
  const std::array<Glyph, 1> glyphs{Glyph{5u, 1.0f, 2.0f}};

  Scene scene{};
  scene.DrawImage(ImageBrush{*image}, Affine{});
  scene.DrawImage(ImageBrush{*image}.WithQuality(ImageQuality::Low), Affine::Translate({2.0, 0.0}));
  scene.DrawImage(ImageBrush{*other_image}, Affine{});
  scene.DrawGlyphs(font, 12.0f, false, {}, FillRule::NonZero, palette::css::BLACK, 1.0f, Affine{}, std::nullopt, glyphs);
  scene.DrawGlyphs(font, 14.0f, true, {}, StrokeStyle{1.0}, palette::css::BLACK, 1.0f, Affine{}, Affine::Skew(0.2, 0.0), glyphs);

  const SceneArchive archive = SceneSerializer{}.Serialize(scene);
  ASSERT_EQ(archive.images.size(), 2u);
  ASSERT_EQ(archive.fonts.size(), 1u);

  const auto& commands = archive.document.at("commands");
  EXPECT_EQ(commands[0].at("paint").at("image"), 0);
  EXPECT_EQ(commands[1].at("paint").at("image"), 0);
  EXPECT_EQ(commands[2].at("paint").at("image"), 1);
  EXPECT_EQ(commands[3].at("font"), 0);
  EXPECT_EQ(commands[4].at("font"), 0);
  EXPECT_EQ(commands[4].at("style").at("stroke").at("width"), 1.0);

  const std::optional<Scene> restored = SceneDeserializer{}.Deserialize(archive);
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(restored->GetCommands(), scene.GetCommands());
}

TEST(SceneSerializer, SameFontBlobWithDifferentIndexIsStoredTwice) {
  const auto blob = Blob::Create({1, 2, 3, 4});
  const std::array<Glyph, 1> glyphs{Glyph{5u, 1.0f, 2.0f}};

  Scene scene{};
  scene.DrawGlyphs({blob, 0u}, 12.0f, false, {}, FillRule::NonZero, palette::css::BLACK, 1.0f, Affine{}, std::nullopt, glyphs);
  scene.DrawGlyphs({blob, 1u}, 12.0f, false, {}, FillRule::NonZero, palette::css::BLACK, 1.0f, Affine{}, std::nullopt, glyphs);

  const SceneArchive archive = SceneSerializer{}.Serialize(scene);
  ASSERT_EQ(archive.fonts.size(), 2u);
  EXPECT_EQ(archive.fonts[1].index, 1u);
}

TEST(SceneSerializer, AlternatingFontFacesAreStoredOncePerFace) {
  const auto blob = Blob::Create({1, 2, 3, 4});
  const std::array<Glyph, 1> glyphs{Glyph{5u, 1.0f, 2.0f}};

  Scene scene{};
  for(int round = 0; round < 3; round++) {
    for(u32 face = 0u; face < 2u; face++) {
      scene.DrawGlyphs({blob, face}, 12.0f, false, {}, FillRule::NonZero, palette::css::BLACK, 1.0f, Affine{}, std::nullopt, glyphs);
    }
  }

  const SceneArchive archive = SceneSerializer{}.Serialize(scene);
  ASSERT_EQ(archive.fonts.size(), 2u);
  EXPECT_EQ(archive.GetFontFileIndices(), (std::vector<size_t>{0u, 0u}));

  const auto& commands = archive.document.at("commands");
  for(size_t i = 0; i < commands.size(); i++) {
    EXPECT_EQ(commands[i].at("font"), i % 2u);
  }

  const auto& fonts = archive.document.at("resources").at("fonts");
  EXPECT_EQ(fonts[0].at("file"), SceneArchive::GetFontFileName(0u));
  EXPECT_EQ(fonts[1].at("file"), SceneArchive::GetFontFileName(0u));
  EXPECT_EQ(fonts[1].at("index"), 1u);
}

TEST(SceneSerializer, ImagesSharingABlobKeepTheirLayout) {
  const auto blob = Blob::Create(std::vector<u8>(16u, 0x40u));
  const auto square = ImageData::FromBlob(blob, ImageFormat::Rgba8, ImageAlphaType::Alpha, 2u, 2u);
  const auto row = ImageData::FromBlob(blob, ImageFormat::Bgra8, ImageAlphaType::AlphaPremultiplied, 4u, 1u);
  ASSERT_TRUE(square.has_value() && row.has_value());

  Scene scene{};
  scene.DrawImage(ImageBrush{*square}, Affine{});
  scene.DrawImage(ImageBrush{*row}, Affine{});
  scene.DrawImage(ImageBrush{*square}, Affine::Scale(2.0));

  const SceneArchive archive = SceneSerializer{}.Serialize(scene);
  ASSERT_EQ(archive.images.size(), 2u);
  EXPECT_EQ(archive.GetImageFileIndices(), (std::vector<size_t>{0u, 0u}));

  const auto& images = archive.document.at("resources").at("images");
  EXPECT_EQ(images[1].at("width"), 4u);
  EXPECT_EQ(images[1].at("format"), "bgra8");
  EXPECT_EQ(images[0].at("file"), images[1].at("file"));

  const std::optional<Scene> restored = SceneDeserializer{}.Deserialize(archive);
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(restored->GetCommands(), scene.GetCommands());
}

TEST(SceneDeserializer, RejectsMalformedDocuments) {
  SceneArchive archive = SceneSerializer{}.Serialize(make_scene_without_resources());

  SceneArchive wrong_version = archive;
  wrong_version.document["version"] = 99;
  EXPECT_FALSE(SceneDeserializer{}.Deserialize(wrong_version).has_value());

  SceneArchive unknown_mix = archive;
  unknown_mix.document["commands"][0]["blend"]["mix"] = "sparkle";
  EXPECT_FALSE(SceneDeserializer{}.Deserialize(unknown_mix).has_value());

  SceneArchive bad_path = archive;
  bad_path.document["commands"][1]["shape"] = "M0 0 Q";
  EXPECT_FALSE(SceneDeserializer{}.Deserialize(bad_path).has_value());

  SceneArchive bad_type = archive;
  bad_type.document["commands"][1]["transform"] = "identity";
  EXPECT_FALSE(SceneDeserializer{}.Deserialize(bad_type).has_value());

  SceneArchive missing_image = archive;
  missing_image.document["commands"][1]["paint"] = {{"type", "image"}, {"image", 3}, {"sampler", {
    {"x_extend", "pad"}, {"y_extend", "pad"}, {"quality", "low"}, {"alpha", 1.0}
  }}};
  EXPECT_FALSE(SceneDeserializer{}.Deserialize(missing_image).has_value());
}
