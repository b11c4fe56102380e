#include <multirender/config.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace multirender {

namespace {

std::string to_lower(std::string_view value) {
  std::string lowered{value};
  for(char& c : lowered) {
    c = (char)std::tolower((unsigned char)c);
  }
  return lowered;
}

void load_window_section(const nlohmann::json& window, RendererConfig& config) {
  if(window.contains("width")) {
    config.window_width = window["width"].get<u32>();
  }
  if(window.contains("height")) {
    config.window_height = window["height"].get<u32>();
  }
  if(window.contains("title")) {
    config.window_title = window["title"].get<std::string>();
  }
}

void load_renderer_section(const nlohmann::json& renderer, RendererConfig& config) {
  if(renderer.contains("backend")) {
    const std::string name = renderer["backend"].get<std::string>();
    const std::optional<WindowBackend> backend = parse_window_backend(name);
    if(backend.has_value()) {
      config.backend = *backend;
    } else {
      MULTIRENDER_WARN("RendererConfig: unknown backend '{}', keeping the default", name);
    }
  }
  if(renderer.contains("tolerance")) {
    config.tolerance = std::max(renderer["tolerance"].get<f64>(), 1e-3);
  }
  if(renderer.contains("vsync")) {
    config.vsync = renderer["vsync"].get<bool>();
  }
  if(renderer.contains("clear_color")) {
    const auto components = renderer["clear_color"].get<std::vector<f32>>();
    if(components.size() == 4u) {
      config.clear_color = {components[0], components[1], components[2], components[3]};
    } else {
      MULTIRENDER_WARN("RendererConfig: clear_color needs four components but got {}", components.size());
    }
  }
}

} // anonymous namespace

std::optional<WindowBackend> parse_window_backend(std::string_view name) {
  const std::string lowered = to_lower(name);

  if(lowered == "software") return WindowBackend::Software;
  if(lowered == "opengl") return WindowBackend::OpenGL;
  if(lowered == "null") return WindowBackend::Null;
  return std::nullopt;
}

std::optional<Logger::Level> parse_log_level(std::string_view name) {
  const std::string lowered = to_lower(name);

  if(lowered == "trace") return Logger::Level::Trace;
  if(lowered == "debug") return Logger::Level::Debug;
  if(lowered == "info") return Logger::Level::Info;
  if(lowered == "warn" || lowered == "warning") return Logger::Level::Warn;
  if(lowered == "error") return Logger::Level::Error;
  if(lowered == "fatal") return Logger::Level::Fatal;
  return std::nullopt;
}

std::optional<RendererConfig> RendererConfig::Parse(std::string_view json_text) {
  RendererConfig config{};

  try {
    const nlohmann::json json = nlohmann::json::parse(json_text);
    if(!json.is_object()) {
      MULTIRENDER_ERROR("RendererConfig: expected a JSON object at the top level");
      return std::nullopt;
    }

    if(auto window = json.find("window"); window != json.end()) {
      load_window_section(*window, config);
    }

    if(auto renderer = json.find("renderer"); renderer != json.end()) {
      load_renderer_section(*renderer, config);
    }

    if(auto logging = json.find("logging"); logging != json.end() && logging->contains("level")) {
      const std::string name = (*logging)["level"].get<std::string>();
      const std::optional<Logger::Level> level = parse_log_level(name);
      if(level.has_value()) {
        config.log_level = *level;
      } else {
        MULTIRENDER_WARN("RendererConfig: unknown log level '{}'", name);
      }
    }

    if(auto serialize = json.find("serialize"); serialize != json.end() && serialize->contains("max_depth")) {
      config.serialize_max_depth = (*serialize)["max_depth"].get<size_t>();
    }
  } catch(const nlohmann::json::exception& err) {
    MULTIRENDER_ERROR("RendererConfig: failed to parse configuration: {}", err.what());
    return std::nullopt;
  }

  return config;
}

RendererConfig RendererConfig::LoadFromFile(const std::filesystem::path& path) {
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) {
    MULTIRENDER_INFO("RendererConfig: {} does not exist, using defaults", path.string());
    return {};
  }

  std::ifstream file{path};
  if(!file.good()) {
    MULTIRENDER_ERROR("RendererConfig: failed to open {}", path.string());
    return {};
  }

  std::stringstream contents{};
  contents << file.rdbuf();

  return Parse(contents.str()).value_or(RendererConfig{});
}

void RendererConfig::ApplyLogLevel() const {
  get_logger().SetMinimumLevel(log_level);
}

} // namespace multirender
