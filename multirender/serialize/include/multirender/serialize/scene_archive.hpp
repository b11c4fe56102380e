#pragma once

#include <multirender/paint/font.hpp>
#include <multirender/paint/image.hpp>
#include <multirender/recording/scene.hpp>
#include <multirender/integer.hpp>
#include <EASTL/hash_map.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <vector>

namespace multirender {

/**
 * A serialized scene: a JSON document describing the commands plus the binary resources
 * (image pixels and font files) the document refers to by index.
 */
struct SceneArchive {
  static constexpr int k_format_version = 1;
  static constexpr const char* k_document_file_name = "scene.json";

  nlohmann::ordered_json document{};
  std::vector<ImageData> images{};
  std::vector<FontData> fonts{};

  /**
   * Writes `scene.json` and the resource files into `directory`, creating it if needed.
   * @param max_depth nesting depth up to which the JSON document is pretty printed
   */
  bool WriteToDirectory(const std::filesystem::path& directory, size_t max_depth) const;

  /**
   * Reads an archive written by WriteToDirectory(). Resource files must be relative paths inside
   * `directory`. Images and fonts that name the same file share one blob.
   */
  static std::optional<SceneArchive> ReadFromDirectory(const std::filesystem::path& directory);

  /**
   * @returns for each entry of `images` the number of the resource file holding its pixels.
   * Entries sharing a blob share the file, so the bytes of a blob are stored once.
   */
  [[nodiscard]] std::vector<size_t> GetImageFileIndices() const;

  /// @returns for each entry of `fonts` the number of the resource file holding the font data.
  [[nodiscard]] std::vector<size_t> GetFontFileIndices() const;

  static std::string GetImageFileName(size_t index);
  static std::string GetFontFileName(size_t index);
};

class SceneSerializer {
  public:
    SceneArchive Serialize(const Scene& scene);

  private:
    nlohmann::ordered_json SerializeCommand(const RenderCommand& command);
    nlohmann::ordered_json SerializePaint(const Paint& paint);
    nlohmann::ordered_json SerializeStyle(const Style& style);
    nlohmann::ordered_json SerializeStrokeStyle(const StrokeStyle& stroke);
    nlohmann::ordered_json SerializeGradient(const Gradient& gradient);
    size_t AddImage(const ImageData& image);
    size_t AddFont(const FontData& font);

    SceneArchive m_archive{};
    // Keyed by a hash over the blob ID and the fields that interpret the blob.
    eastl::hash_map<size_t, size_t> m_image_index_table{};
    eastl::hash_map<size_t, size_t> m_font_index_table{};
};

class SceneDeserializer {
  public:
    /// @returns the reconstructed scene or an empty optional if the document is malformed.
    std::optional<Scene> Deserialize(const SceneArchive& archive);

  private:
    std::optional<RenderCommand> DeserializeCommand(const nlohmann::ordered_json& json);
    std::optional<Paint> DeserializePaint(const nlohmann::ordered_json& json);
    std::optional<Style> DeserializeStyle(const nlohmann::ordered_json& json);
    std::optional<StrokeStyle> DeserializeStrokeStyle(const nlohmann::ordered_json& json);
    std::optional<Gradient> DeserializeGradient(const nlohmann::ordered_json& json);

    const SceneArchive* m_archive{};
};

} // namespace multirender
