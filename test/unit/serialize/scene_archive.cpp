#include <multirender/math/rect.hpp>
#include <multirender/serialize/scene_archive.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

using namespace multirender;
namespace fs = std::filesystem;

namespace {

class SceneArchiveTest : public ::testing::Test {
  protected:
    void SetUp() override {
      m_directory = fs::temp_directory_path() / ("multirender-archive-" + std::to_string(std::random_device{}()));
    }

    void TearDown() override {
      std::error_code ec;
      fs::remove_all(m_directory, ec);
    }

    fs::path m_directory{};
};

std::vector<u8> read_bytes(const fs::path& path) {
  std::ifstream file{path, std::ios::binary};
  return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

} // anonymous namespace

TEST_F(SceneArchiveTest, WriteThenReadRestoresScene) {
  const std::vector<u8> pixels{255, 0, 0, 255, 0, 255, 0, 128};
  const auto image = ImageData::Create(pixels, ImageFormat::Rgba8, ImageAlphaType::Alpha, 2u, 1u);
  ASSERT_TRUE(image.has_value());
  const FontData font{Blob::Create({'O', 'T', 'T', 'O'}), 2u};
  const std::array<Glyph, 2> glyphs{Glyph{1u, 0.0f, 0.0f}, Glyph{2u, 6.0f, 0.0f}};

  Scene scene{};
  scene.Fill(FillRule::NonZero, Affine{}, palette::css::CORNFLOWER_BLUE, std::nullopt, Rect{0.0, 0.0, 8.0, 8.0});
  scene.DrawImage(ImageBrush{*image}.WithExtend(Extend::Repeat), Affine::Scale(4.0));
  scene.DrawGlyphs(font, 10.0f, true, {}, FillRule::NonZero, palette::css::BLACK, 1.0f, Affine{}, std::nullopt, glyphs);

  const SceneArchive archive = SceneSerializer{}.Serialize(scene);
  ASSERT_TRUE(archive.WriteToDirectory(m_directory, 2u));

  EXPECT_TRUE(fs::exists(m_directory / SceneArchive::k_document_file_name));
  EXPECT_EQ(read_bytes(m_directory / SceneArchive::GetImageFileName(0u)), pixels);
  EXPECT_EQ(read_bytes(m_directory / SceneArchive::GetFontFileName(0u)), (std::vector<u8>{'O', 'T', 'T', 'O'}));

  const std::optional<SceneArchive> loaded = SceneArchive::ReadFromDirectory(m_directory);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->document, archive.document);
  ASSERT_EQ(loaded->images.size(), 1u);
  ASSERT_EQ(loaded->fonts.size(), 1u);
  EXPECT_EQ(loaded->images[0].width, 2u);
  EXPECT_EQ(loaded->fonts[0].index, 2u);

  const std::optional<Scene> restored = SceneDeserializer{}.Deserialize(*loaded);
  ASSERT_TRUE(restored.has_value());
  ASSERT_EQ(restored->GetCommands().size(), 3u);
  EXPECT_EQ(restored->GetCommands()[0], scene.GetCommands()[0]);

  const auto& image_fill = std::get<FillCommand>(restored->GetCommands()[1]);
  const auto& brush = std::get<ImageBrush>(image_fill.paint);
  EXPECT_EQ(brush.sampler.x_extend, Extend::Repeat);
  EXPECT_TRUE(std::ranges::equal(brush.image.data->Data(), pixels));
  EXPECT_EQ(image_fill.transform, Affine::Scale(4.0));

  const auto& glyph_run = std::get<GlyphRunCommand>(restored->GetCommands()[2]);
  EXPECT_EQ(glyph_run.glyphs, std::vector<Glyph>(glyphs.begin(), glyphs.end()));
  EXPECT_EQ(glyph_run.font.index, 2u);
}

TEST_F(SceneArchiveTest, DocumentIsPrettyPrintedToRequestedDepth) {
  Scene scene{};
  scene.PopLayer();

  ASSERT_TRUE(SceneSerializer{}.Serialize(scene).WriteToDirectory(m_directory, 1u));

  std::ifstream file{m_directory / SceneArchive::k_document_file_name};
  const std::string text{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
  EXPECT_NE(text.find("\n  \"commands\": [{\"type\": \"pop_layer\"}]"), std::string::npos);
}

TEST_F(SceneArchiveTest, ReadingMissingDirectoryFails) {
  EXPECT_FALSE(SceneArchive::ReadFromDirectory(m_directory).has_value());
}

TEST_F(SceneArchiveTest, ReadingTruncatedImageFails) {
  const auto image = ImageData::Create(std::vector<u8>(16u), ImageFormat::Rgba8, ImageAlphaType::Alpha, 2u, 2u);
  ASSERT_TRUE(image.has_value());

  Scene scene{};
  scene.DrawImage(ImageBrush{*image}, Affine{});
  ASSERT_TRUE(SceneSerializer{}.Serialize(scene).WriteToDirectory(m_directory, 3u));

  fs::resize_file(m_directory / SceneArchive::GetImageFileName(0u), 10u);
  EXPECT_FALSE(SceneArchive::ReadFromDirectory(m_directory).has_value());
}

TEST_F(SceneArchiveTest, ReadingInvalidJsonFails) {
  fs::create_directories(m_directory);
  {
    std::ofstream file{m_directory / SceneArchive::k_document_file_name};
    file << "{\"version\": 1, ";
  }
  EXPECT_FALSE(SceneArchive::ReadFromDirectory(m_directory).has_value());
}

TEST_F(SceneArchiveTest, SharedBlobsAreWrittenOnceAndSharedAfterReading) {
  const std::vector<u8> pixels(16u, 0x20u);
  const auto blob = Blob::Create(pixels);
  const auto square = ImageData::FromBlob(blob, ImageFormat::Rgba8, ImageAlphaType::Alpha, 2u, 2u);
  const auto row = ImageData::FromBlob(blob, ImageFormat::Rgba8, ImageAlphaType::Alpha, 4u, 1u);
  ASSERT_TRUE(square.has_value() && row.has_value());
  const auto font_blob = Blob::Create({'t', 't', 'c', 'f'});
  const std::array<Glyph, 1> glyphs{Glyph{3u, 0.0f, 0.0f}};

  Scene scene{};
  scene.DrawImage(ImageBrush{*square}, Affine{});
  scene.DrawImage(ImageBrush{*row}, Affine{});
  scene.DrawGlyphs({font_blob, 0u}, 10.0f, false, {}, FillRule::NonZero, palette::css::BLACK, 1.0f, Affine{}, std::nullopt, glyphs);
  scene.DrawGlyphs({font_blob, 1u}, 10.0f, false, {}, FillRule::NonZero, palette::css::BLACK, 1.0f, Affine{}, std::nullopt, glyphs);

  ASSERT_TRUE(SceneSerializer{}.Serialize(scene).WriteToDirectory(m_directory, 2u));
  EXPECT_EQ(read_bytes(m_directory / SceneArchive::GetImageFileName(0u)), pixels);
  EXPECT_FALSE(fs::exists(m_directory / SceneArchive::GetImageFileName(1u)));
  EXPECT_TRUE(fs::exists(m_directory / SceneArchive::GetFontFileName(0u)));
  EXPECT_FALSE(fs::exists(m_directory / SceneArchive::GetFontFileName(1u)));

  const std::optional<SceneArchive> loaded = SceneArchive::ReadFromDirectory(m_directory);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->images.size(), 2u);
  ASSERT_EQ(loaded->fonts.size(), 2u);
  EXPECT_EQ(loaded->images[0].data, loaded->images[1].data);
  EXPECT_EQ(loaded->images[0].width, 2u);
  EXPECT_EQ(loaded->images[1].width, 4u);
  EXPECT_EQ(loaded->images[1].height, 1u);
  EXPECT_EQ(loaded->fonts[0].data, loaded->fonts[1].data);
  EXPECT_EQ(loaded->fonts[1].index, 1u);
}

TEST_F(SceneArchiveTest, ResourcePathsOutsideTheDirectoryAreRejected) {
  const auto image = ImageData::Create(std::vector<u8>(4u, 0xFFu), ImageFormat::Rgba8, ImageAlphaType::Alpha, 1u, 1u);
  ASSERT_TRUE(image.has_value());

  Scene scene{};
  scene.DrawImage(ImageBrush{*image}, Affine{});
  const SceneArchive archive = SceneSerializer{}.Serialize(scene);

  // A readable file of the right size next to the scene directory.
  const fs::path outside_file = m_directory.parent_path() / (m_directory.filename().string() + "-outside.bin");
  {
    std::ofstream file{outside_file, std::ios::binary};
    file.write("\xFF\xFF\xFF\xFF", 4);
  }

  const std::array<std::string, 4> file_names{
    "../" + outside_file.filename().string(),
    outside_file.string(),
    "resources/../../" + outside_file.filename().string(),
    "."
  };

  for(const std::string& file_name : file_names) {
    SceneArchive tampered = archive;
    tampered.document["resources"]["images"][0]["file"] = file_name;
    ASSERT_TRUE(tampered.WriteToDirectory(m_directory, 2u));
    EXPECT_FALSE(SceneArchive::ReadFromDirectory(m_directory).has_value()) << file_name;
  }

  std::error_code ec;
  fs::remove(outside_file, ec);
}
