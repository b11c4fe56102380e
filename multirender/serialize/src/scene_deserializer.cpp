#include <multirender/serialize/scene_archive.hpp>
#include <multirender/logger/logger.hpp>
#include <string>

#include "json_conversion.hpp"

namespace multirender {

using namespace detail;
using json = nlohmann::ordered_json;

namespace {

template<typename E, size_t N>
std::optional<E> read_enum(const json& value, const EnumNameTable<E, N>& table, const char* what) {
  const std::string name = value.get<std::string>();
  const std::optional<E> result = table.FromString(name);
  if(!result.has_value()) {
    MULTIRENDER_ERROR("SceneDeserializer: unknown {} '{}'", what, name);
  }
  return result;
}

std::optional<BezPath> read_path(const json& value) {
  const std::string svg = value.get<std::string>();
  std::optional<BezPath> path = BezPath::FromSvg(svg);
  if(!path.has_value()) {
    MULTIRENDER_ERROR("SceneDeserializer: malformed path data '{}'", svg);
  }
  return path;
}

} // anonymous namespace

std::optional<Scene> SceneDeserializer::Deserialize(const SceneArchive& archive) {
  m_archive = &archive;
  const json& document = archive.document;

  try {
    const int version = document.at("version").get<int>();
    if(version != SceneArchive::k_format_version) {
      MULTIRENDER_ERROR("SceneDeserializer: unsupported format version {}", version);
      return std::nullopt;
    }

    Scene scene{document.value("tolerance", k_default_tolerance)};

    for(const json& command_json : document.at("commands")) {
      std::optional<RenderCommand> command = DeserializeCommand(command_json);
      if(!command.has_value()) {
        return std::nullopt;
      }
      scene.PushCommand(std::move(*command));
    }

    return scene;
  } catch(const nlohmann::json::exception& err) {
    MULTIRENDER_ERROR("SceneDeserializer: malformed scene document: {}", err.what());
    return std::nullopt;
  }
}

std::optional<RenderCommand> SceneDeserializer::DeserializeCommand(const json& node) {
  const std::string type = node.at("type").get<std::string>();

  if(type == "push_layer") {
    const auto& blend = node.at("blend");
    const auto mix = read_enum(blend.at("mix"), k_mix_names, "mix mode");
    const auto compose = read_enum(blend.at("compose"), k_compose_names, "compose mode");
    auto clip = read_path(node.at("clip"));
    if(!mix || !compose || !clip) {
      return std::nullopt;
    }
    return LayerCommand{
      .blend = {*mix, *compose},
      .alpha = node.at("alpha").get<f32>(),
      .transform = affine_from_json(node.at("transform")),
      .clip = std::move(*clip)
    };
  }

  if(type == "push_clip_layer") {
    auto clip = read_path(node.at("clip"));
    if(!clip) {
      return std::nullopt;
    }
    return ClipCommand{
      .transform = affine_from_json(node.at("transform")),
      .clip = std::move(*clip)
    };
  }

  if(type == "pop_layer") {
    return PopLayerCommand{};
  }

  if(type == "stroke") {
    auto style = DeserializeStrokeStyle(node.at("style"));
    auto paint = DeserializePaint(node.at("paint"));
    auto shape = read_path(node.at("shape"));
    if(!style || !paint || !shape) {
      return std::nullopt;
    }
    return StrokeCommand{
      .style = std::move(*style),
      .transform = affine_from_json(node.at("transform")),
      .paint = std::move(*paint),
      .brush_transform = optional_affine_from_json(node.at("brush_transform")),
      .shape = std::move(*shape)
    };
  }

  if(type == "fill") {
    const auto fill = read_enum(node.at("fill"), k_fill_rule_names, "fill rule");
    auto paint = DeserializePaint(node.at("paint"));
    auto shape = read_path(node.at("shape"));
    if(!fill || !paint || !shape) {
      return std::nullopt;
    }
    return FillCommand{
      .fill = *fill,
      .transform = affine_from_json(node.at("transform")),
      .paint = std::move(*paint),
      .brush_transform = optional_affine_from_json(node.at("brush_transform")),
      .shape = std::move(*shape)
    };
  }

  if(type == "glyph_run") {
    const size_t font_index = node.at("font").get<size_t>();
    if(font_index >= m_archive->fonts.size()) {
      MULTIRENDER_ERROR("SceneDeserializer: font index {} is out of bounds", font_index);
      return std::nullopt;
    }

    auto style = DeserializeStyle(node.at("style"));
    auto paint = DeserializePaint(node.at("paint"));
    if(!style || !paint) {
      return std::nullopt;
    }

    std::vector<Glyph> glyphs{};
    for(const auto& glyph_json : node.at("glyphs")) {
      glyphs.push_back({
        .id = glyph_json.at(0).get<u32>(),
        .x = glyph_json.at(1).get<f32>(),
        .y = glyph_json.at(2).get<f32>()
      });
    }

    return GlyphRunCommand{
      .font = m_archive->fonts[font_index],
      .font_size = node.at("font_size").get<f32>(),
      .hint = node.at("hint").get<bool>(),
      .normalized_coords = node.at("normalized_coords").get<std::vector<NormalizedCoord>>(),
      .style = std::move(*style),
      .paint = std::move(*paint),
      .brush_alpha = node.at("brush_alpha").get<f32>(),
      .transform = affine_from_json(node.at("transform")),
      .glyph_transform = optional_affine_from_json(node.at("glyph_transform")),
      .glyphs = std::move(glyphs)
    };
  }

  if(type == "box_shadow") {
    return BoxShadowCommand{
      .transform = affine_from_json(node.at("transform")),
      .rect = rect_from_json(node.at("rect")),
      .color = color_from_json(node.at("color")),
      .radius = node.at("radius").get<f64>(),
      .std_dev = node.at("std_dev").get<f64>()
    };
  }

  MULTIRENDER_ERROR("SceneDeserializer: unknown command type '{}'", type);
  return std::nullopt;
}

std::optional<Paint> SceneDeserializer::DeserializePaint(const json& node) {
  const std::string type = node.at("type").get<std::string>();

  if(type == "solid") {
    return color_from_json(node.at("color"));
  }

  if(type == "gradient") {
    std::optional<Gradient> gradient = DeserializeGradient(node.at("gradient"));
    if(!gradient) {
      return std::nullopt;
    }
    return std::move(*gradient);
  }

  if(type == "image") {
    const size_t image_index = node.at("image").get<size_t>();
    if(image_index >= m_archive->images.size()) {
      MULTIRENDER_ERROR("SceneDeserializer: image index {} is out of bounds", image_index);
      return std::nullopt;
    }

    const auto& sampler_json = node.at("sampler");
    const auto x_extend = read_enum(sampler_json.at("x_extend"), k_extend_names, "extend mode");
    const auto y_extend = read_enum(sampler_json.at("y_extend"), k_extend_names, "extend mode");
    const auto quality = read_enum(sampler_json.at("quality"), k_image_quality_names, "image quality");
    if(!x_extend || !y_extend || !quality) {
      return std::nullopt;
    }

    return ImageBrush{m_archive->images[image_index], ImageSampler{
      .x_extend = *x_extend,
      .y_extend = *y_extend,
      .quality = *quality,
      .alpha = sampler_json.at("alpha").get<f32>()
    }};
  }

  if(type == "custom") {
    return CustomPaint{
      .source_id = node.at("source_id").get<u64>(),
      .width = node.at("width").get<u32>(),
      .height = node.at("height").get<u32>(),
      .scale = node.at("scale").get<f64>()
    };
  }

  MULTIRENDER_ERROR("SceneDeserializer: unknown paint type '{}'", type);
  return std::nullopt;
}

std::optional<Style> SceneDeserializer::DeserializeStyle(const json& node) {
  if(node.contains("fill")) {
    const auto fill = read_enum(node.at("fill"), k_fill_rule_names, "fill rule");
    if(!fill) {
      return std::nullopt;
    }
    return *fill;
  }

  std::optional<StrokeStyle> stroke = DeserializeStrokeStyle(node.at("stroke"));
  if(!stroke) {
    return std::nullopt;
  }
  return std::move(*stroke);
}

std::optional<StrokeStyle> SceneDeserializer::DeserializeStrokeStyle(const json& node) {
  const auto join = read_enum(node.at("join"), k_join_names, "join");
  const auto start_cap = read_enum(node.at("start_cap"), k_cap_names, "cap");
  const auto end_cap = read_enum(node.at("end_cap"), k_cap_names, "cap");
  if(!join || !start_cap || !end_cap) {
    return std::nullopt;
  }

  StrokeStyle stroke{node.at("width").get<f64>()};
  stroke.join = *join;
  stroke.miter_limit = node.at("miter_limit").get<f64>();
  stroke.start_cap = *start_cap;
  stroke.end_cap = *end_cap;
  stroke.dash_pattern = node.at("dash_pattern").get<std::vector<f64>>();
  stroke.dash_offset = node.at("dash_offset").get<f64>();
  return stroke;
}

std::optional<Gradient> SceneDeserializer::DeserializeGradient(const json& node) {
  const auto& kind_json = node.at("kind");
  const std::string kind_type = kind_json.at("type").get<std::string>();

  GradientKind kind{};
  if(kind_type == "linear") {
    kind = LinearGradientPosition{
      .start = point_from_json(kind_json.at("start")),
      .end = point_from_json(kind_json.at("end"))
    };
  } else if(kind_type == "radial") {
    kind = RadialGradientPosition{
      .start_center = point_from_json(kind_json.at("start_center")),
      .start_radius = kind_json.at("start_radius").get<f32>(),
      .end_center = point_from_json(kind_json.at("end_center")),
      .end_radius = kind_json.at("end_radius").get<f32>()
    };
  } else if(kind_type == "sweep") {
    kind = SweepGradientPosition{
      .center = point_from_json(kind_json.at("center")),
      .start_angle = kind_json.at("start_angle").get<f32>(),
      .end_angle = kind_json.at("end_angle").get<f32>()
    };
  } else {
    MULTIRENDER_ERROR("SceneDeserializer: unknown gradient kind '{}'", kind_type);
    return std::nullopt;
  }

  const auto extend = read_enum(node.at("extend"), k_extend_names, "extend mode");
  if(!extend) {
    return std::nullopt;
  }

  std::vector<ColorStop> stops{};
  for(const auto& stop_json : node.at("stops")) {
    stops.push_back({
      .offset = stop_json.at("offset").get<f32>(),
      .color = color_from_json(stop_json.at("color"))
    });
  }

  Gradient gradient{kind};
  gradient.WithExtend(*extend).WithStops(std::move(stops));
  return gradient;
}

} // namespace multirender
