#include <multirender/serialize/json_formatter.hpp>
#include <multirender/serialize/scene_archive.hpp>
#include <multirender/logger/logger.hpp>
#include <EASTL/hash_map.h>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <unordered_map>

#include "json_conversion.hpp"

namespace fs = std::filesystem;

namespace multirender {

using namespace detail;
using json = nlohmann::ordered_json;

namespace {

bool write_file(const fs::path& path, std::span<const u8> data) {
  std::error_code error{};
  fs::create_directories(path.parent_path(), error);
  if(error) {
    MULTIRENDER_ERROR("SceneArchive: failed to create directory '{}': {}", path.parent_path().string(), error.message());
    return false;
  }

  std::ofstream file{path, std::ios::binary | std::ios::trunc};
  if(!file.good()) {
    MULTIRENDER_ERROR("SceneArchive: failed to open '{}' for writing", path.string());
    return false;
  }
  file.write((const char*)data.data(), (std::streamsize)data.size());
  return file.good();
}

std::optional<std::vector<u8>> read_file(const fs::path& path) {
  std::ifstream file{path, std::ios::binary};
  if(!file.good()) {
    MULTIRENDER_ERROR("SceneArchive: failed to open '{}'", path.string());
    return std::nullopt;
  }
  return std::vector<u8>{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

/// Numbers the distinct blobs of `resources` in order of first use.
template<typename Resource>
std::vector<size_t> assign_file_indices(const std::vector<Resource>& resources) {
  eastl::hash_map<u64, size_t> file_index_table{};
  std::vector<size_t> file_indices{};
  file_indices.reserve(resources.size());

  for(const Resource& resource : resources) {
    const u64 blob_id = resource.data ? resource.data->GetID() : 0u;

    auto match = file_index_table.find(blob_id);
    if(match == file_index_table.end()) {
      match = file_index_table.insert(eastl::make_pair(blob_id, file_index_table.size())).first;
    }
    file_indices.push_back(match->second);
  }

  return file_indices;
}

/// Resolves a resource file name from a document, rejecting names that would leave `directory`.
std::optional<fs::path> resolve_resource_path(const fs::path& directory, const std::string& file_name) {
  const fs::path relative_path = fs::path{file_name}.lexically_normal();

  bool escapes = relative_path.empty() || relative_path == "." || relative_path.has_root_path();
  for(const fs::path& component : relative_path) {
    escapes = escapes || component == "..";
  }

  if(escapes) {
    MULTIRENDER_ERROR("SceneArchive: resource path '{}' is not a relative path inside the scene directory", file_name);
    return std::nullopt;
  }

  return directory / relative_path;
}

/// Loads resource files, reading each file only once so that resources naming the same file share a blob.
class BlobLoader {
  public:
    explicit BlobLoader(const fs::path& directory) : m_directory{directory} {}

    std::shared_ptr<const Blob> Load(const std::string& file_name) {
      const auto match = m_blobs.find(file_name);
      if(match != m_blobs.end()) {
        return match->second;
      }

      const std::optional<fs::path> path = resolve_resource_path(m_directory, file_name);
      if(!path.has_value()) {
        return nullptr;
      }

      std::optional<std::vector<u8>> data = read_file(*path);
      if(!data.has_value()) {
        return nullptr;
      }

      return m_blobs[file_name] = Blob::Create(std::move(*data));
    }

  private:
    fs::path m_directory;
    std::unordered_map<std::string, std::shared_ptr<const Blob>> m_blobs{};
};

} // anonymous namespace

std::vector<size_t> SceneArchive::GetImageFileIndices() const {
  return assign_file_indices(images);
}

std::vector<size_t> SceneArchive::GetFontFileIndices() const {
  return assign_file_indices(fonts);
}

bool SceneArchive::WriteToDirectory(const fs::path& directory, size_t max_depth) const {
  const std::string text = dump_json_depth_limited(document, max_depth);
  if(!write_file(directory / k_document_file_name, {(const u8*)text.data(), text.size()})) {
    return false;
  }

  const std::vector<size_t> image_file_indices = GetImageFileIndices();
  std::vector<bool> image_file_written(images.size(), false);

  for(size_t i = 0; i < images.size(); i++) {
    if(!images[i].data) {
      MULTIRENDER_ERROR("SceneArchive: image {} has no pixel data", i);
      return false;
    }
    const size_t file_index = image_file_indices[i];
    if(image_file_written[file_index]) {
      continue;
    }
    if(!write_file(directory / GetImageFileName(file_index), images[i].data->Data())) {
      return false;
    }
    image_file_written[file_index] = true;
  }

  const std::vector<size_t> font_file_indices = GetFontFileIndices();
  std::vector<bool> font_file_written(fonts.size(), false);

  for(size_t i = 0; i < fonts.size(); i++) {
    if(!fonts[i].data) {
      MULTIRENDER_ERROR("SceneArchive: font {} has no data", i);
      return false;
    }
    const size_t file_index = font_file_indices[i];
    if(font_file_written[file_index]) {
      continue;
    }
    if(!write_file(directory / GetFontFileName(file_index), fonts[i].data->Data())) {
      return false;
    }
    font_file_written[file_index] = true;
  }

  MULTIRENDER_DEBUG("SceneArchive: wrote {} images and {} fonts to '{}'", images.size(), fonts.size(), directory.string());
  return true;
}

std::optional<SceneArchive> SceneArchive::ReadFromDirectory(const fs::path& directory) {
  const std::optional<std::vector<u8>> document_bytes = read_file(directory / k_document_file_name);
  if(!document_bytes.has_value()) {
    return std::nullopt;
  }

  SceneArchive archive{};
  BlobLoader blob_loader{directory};

  try {
    archive.document = json::parse(document_bytes->begin(), document_bytes->end());

    const json& resources = archive.document.at("resources");

    for(const json& image_json : resources.at("images")) {
      const auto format = k_image_format_names.FromString(image_json.at("format").get<std::string>());
      const auto alpha_type = k_image_alpha_type_names.FromString(image_json.at("alpha_type").get<std::string>());
      if(!format || !alpha_type) {
        MULTIRENDER_ERROR("SceneArchive: image {} has an unknown pixel format", archive.images.size());
        return std::nullopt;
      }

      std::shared_ptr<const Blob> pixels = blob_loader.Load(image_json.at("file").get<std::string>());
      if(!pixels) {
        return std::nullopt;
      }

      std::optional<ImageData> image = ImageData::FromBlob(
        std::move(pixels), *format, *alpha_type, image_json.at("width").get<u32>(), image_json.at("height").get<u32>());
      if(!image.has_value()) {
        return std::nullopt;
      }
      archive.images.push_back(std::move(*image));
    }

    for(const json& font_json : resources.at("fonts")) {
      std::shared_ptr<const Blob> data = blob_loader.Load(font_json.at("file").get<std::string>());
      if(!data) {
        return std::nullopt;
      }
      archive.fonts.push_back({
        .data = std::move(data),
        .index = font_json.at("index").get<u32>()
      });
    }
  } catch(const nlohmann::json::exception& err) {
    MULTIRENDER_ERROR("SceneArchive: failed to parse '{}': {}", (directory / k_document_file_name).string(), err.what());
    return std::nullopt;
  }

  return archive;
}

} // namespace multirender
