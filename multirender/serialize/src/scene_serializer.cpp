#include <multirender/serialize/scene_archive.hpp>
#include <multirender/hash.hpp>
#include <fmt/format.h>
#include <type_traits>

#include "json_conversion.hpp"

namespace multirender {

using namespace detail;
using json = nlohmann::ordered_json;

SceneArchive SceneSerializer::Serialize(const Scene& scene) {
  m_archive = {};
  m_image_index_table.clear();
  m_font_index_table.clear();

  json commands = json::array();
  for(const RenderCommand& command : scene.GetCommands()) {
    commands.push_back(SerializeCommand(command));
  }

  const std::vector<size_t> image_file_indices = m_archive.GetImageFileIndices();
  const std::vector<size_t> font_file_indices = m_archive.GetFontFileIndices();

  json images = json::array();
  for(size_t i = 0; i < m_archive.images.size(); i++) {
    const ImageData& image = m_archive.images[i];
    images.push_back({
      {"width", image.width},
      {"height", image.height},
      {"format", k_image_format_names.ToString(image.format)},
      {"alpha_type", k_image_alpha_type_names.ToString(image.alpha_type)},
      {"file", SceneArchive::GetImageFileName(image_file_indices[i])}
    });
  }

  json fonts = json::array();
  for(size_t i = 0; i < m_archive.fonts.size(); i++) {
    fonts.push_back({
      {"index", m_archive.fonts[i].index},
      {"file", SceneArchive::GetFontFileName(font_file_indices[i])}
    });
  }

  json& document = m_archive.document;
  document["version"] = SceneArchive::k_format_version;
  document["tolerance"] = scene.GetTolerance();
  document["resources"] = {
    {"images", std::move(images)},
    {"fonts", std::move(fonts)}
  };
  document["commands"] = std::move(commands);

  return std::move(m_archive);
}

json SceneSerializer::SerializeCommand(const RenderCommand& command) {
  return std::visit([&](const auto& cmd) -> json {
    using T = std::decay_t<decltype(cmd)>;

    if constexpr(std::is_same_v<T, LayerCommand>) {
      return {
        {"type", "push_layer"},
        {"blend", {
          {"mix", k_mix_names.ToString(cmd.blend.mix)},
          {"compose", k_compose_names.ToString(cmd.blend.compose)}
        }},
        {"alpha", cmd.alpha},
        {"transform", to_json(cmd.transform)},
        {"clip", cmd.clip.ToSvg()}
      };
    } else if constexpr(std::is_same_v<T, ClipCommand>) {
      return {
        {"type", "push_clip_layer"},
        {"transform", to_json(cmd.transform)},
        {"clip", cmd.clip.ToSvg()}
      };
    } else if constexpr(std::is_same_v<T, PopLayerCommand>) {
      return {{"type", "pop_layer"}};
    } else if constexpr(std::is_same_v<T, StrokeCommand>) {
      return {
        {"type", "stroke"},
        {"style", SerializeStrokeStyle(cmd.style)},
        {"transform", to_json(cmd.transform)},
        {"paint", SerializePaint(cmd.paint)},
        {"brush_transform", to_json(cmd.brush_transform)},
        {"shape", cmd.shape.ToSvg()}
      };
    } else if constexpr(std::is_same_v<T, FillCommand>) {
      return {
        {"type", "fill"},
        {"fill", k_fill_rule_names.ToString(cmd.fill)},
        {"transform", to_json(cmd.transform)},
        {"paint", SerializePaint(cmd.paint)},
        {"brush_transform", to_json(cmd.brush_transform)},
        {"shape", cmd.shape.ToSvg()}
      };
    } else if constexpr(std::is_same_v<T, GlyphRunCommand>) {
      json glyphs = json::array();
      for(const Glyph& glyph : cmd.glyphs) {
        glyphs.push_back(json::array({glyph.id, glyph.x, glyph.y}));
      }
      return {
        {"type", "glyph_run"},
        {"font", AddFont(cmd.font)},
        {"font_size", cmd.font_size},
        {"hint", cmd.hint},
        {"normalized_coords", cmd.normalized_coords},
        {"style", SerializeStyle(cmd.style)},
        {"paint", SerializePaint(cmd.paint)},
        {"brush_alpha", cmd.brush_alpha},
        {"transform", to_json(cmd.transform)},
        {"glyph_transform", to_json(cmd.glyph_transform)},
        {"glyphs", std::move(glyphs)}
      };
    } else if constexpr(std::is_same_v<T, BoxShadowCommand>) {
      return {
        {"type", "box_shadow"},
        {"transform", to_json(cmd.transform)},
        {"rect", to_json(cmd.rect)},
        {"color", to_json(cmd.color)},
        {"radius", cmd.radius},
        {"std_dev", cmd.std_dev}
      };
    }
  }, command);
}

json SceneSerializer::SerializePaint(const Paint& paint) {
  return std::visit([&](const auto& value) -> json {
    using T = std::decay_t<decltype(value)>;

    if constexpr(std::is_same_v<T, Color>) {
      return {
        {"type", "solid"},
        {"color", to_json(value)}
      };
    } else if constexpr(std::is_same_v<T, Gradient>) {
      return {
        {"type", "gradient"},
        {"gradient", SerializeGradient(value)}
      };
    } else if constexpr(std::is_same_v<T, ImageBrush>) {
      return {
        {"type", "image"},
        {"image", AddImage(value.image)},
        {"sampler", {
          {"x_extend", k_extend_names.ToString(value.sampler.x_extend)},
          {"y_extend", k_extend_names.ToString(value.sampler.y_extend)},
          {"quality", k_image_quality_names.ToString(value.sampler.quality)},
          {"alpha", value.sampler.alpha}
        }}
      };
    } else if constexpr(std::is_same_v<T, CustomPaint>) {
      return {
        {"type", "custom"},
        {"source_id", value.source_id},
        {"width", value.width},
        {"height", value.height},
        {"scale", value.scale}
      };
    }
  }, paint);
}

json SceneSerializer::SerializeStyle(const Style& style) {
  if(const auto* fill = std::get_if<FillRule>(&style)) {
    return {{"fill", k_fill_rule_names.ToString(*fill)}};
  }
  return {{"stroke", SerializeStrokeStyle(std::get<StrokeStyle>(style))}};
}

json SceneSerializer::SerializeStrokeStyle(const StrokeStyle& stroke) {
  return {
    {"width", stroke.width},
    {"join", k_join_names.ToString(stroke.join)},
    {"miter_limit", stroke.miter_limit},
    {"start_cap", k_cap_names.ToString(stroke.start_cap)},
    {"end_cap", k_cap_names.ToString(stroke.end_cap)},
    {"dash_pattern", stroke.dash_pattern},
    {"dash_offset", stroke.dash_offset}
  };
}

json SceneSerializer::SerializeGradient(const Gradient& gradient) {
  json kind = std::visit([](const auto& position) -> json {
    using T = std::decay_t<decltype(position)>;

    if constexpr(std::is_same_v<T, LinearGradientPosition>) {
      return {
        {"type", "linear"},
        {"start", to_json(position.start)},
        {"end", to_json(position.end)}
      };
    } else if constexpr(std::is_same_v<T, RadialGradientPosition>) {
      return {
        {"type", "radial"},
        {"start_center", to_json(position.start_center)},
        {"start_radius", position.start_radius},
        {"end_center", to_json(position.end_center)},
        {"end_radius", position.end_radius}
      };
    } else if constexpr(std::is_same_v<T, SweepGradientPosition>) {
      return {
        {"type", "sweep"},
        {"center", to_json(position.center)},
        {"start_angle", position.start_angle},
        {"end_angle", position.end_angle}
      };
    }
  }, gradient.GetKind());

  json stops = json::array();
  for(const ColorStop& stop : gradient.GetStops()) {
    stops.push_back({
      {"offset", stop.offset},
      {"color", to_json(stop.color)}
    });
  }

  return {
    {"kind", std::move(kind)},
    {"extend", k_extend_names.ToString(gradient.GetExtend())},
    {"stops", std::move(stops)}
  };
}

size_t SceneSerializer::AddImage(const ImageData& image) {
  size_t key = 0u;
  hash_combine(key, image.data ? image.data->GetID() : 0u);
  hash_combine(key, image.format);
  hash_combine(key, image.alpha_type);
  hash_combine(key, image.width);
  hash_combine(key, image.height);

  const auto match = m_image_index_table.find(key);
  if(match != m_image_index_table.end() && m_archive.images[match->second] == image) {
    return match->second;
  }

  const size_t index = m_archive.images.size();
  m_archive.images.push_back(image);
  m_image_index_table[key] = index;
  return index;
}

size_t SceneSerializer::AddFont(const FontData& font) {
  size_t key = 0u;
  hash_combine(key, font.data ? font.data->GetID() : 0u);
  hash_combine(key, font.index);

  const auto match = m_font_index_table.find(key);
  if(match != m_font_index_table.end() && m_archive.fonts[match->second] == font) {
    return match->second;
  }

  const size_t index = m_archive.fonts.size();
  m_archive.fonts.push_back(font);
  m_font_index_table[key] = index;
  return index;
}

std::string SceneArchive::GetImageFileName(size_t index) {
  return fmt::format("resources/images/{}.bin", index);
}

std::string SceneArchive::GetFontFileName(size_t index) {
  return fmt::format("resources/fonts/{}.bin", index);
}

} // namespace multirender
