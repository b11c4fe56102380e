#pragma once

#include <multirender/logger/logger.hpp>
#include <multirender/paint/color.hpp>
#include <multirender/float.hpp>
#include <multirender/integer.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace multirender {

enum class WindowBackend {
  Software,
  OpenGL,
  Null
};

struct RendererConfig {
  u32 window_width{1280};
  u32 window_height{720};
  std::string window_title{"MultiRender"};

#ifdef MULTIRENDER_OPENGL
  WindowBackend backend{WindowBackend::OpenGL};
#else
  WindowBackend backend{WindowBackend::Software};
#endif
  f64 tolerance{0.1};
  bool vsync{true};
  Color clear_color{palette::css::WHITE};

  Logger::Level log_level{Logger::Level::Info};

  size_t serialize_max_depth{3u};

  /**
   * Loads the configuration from a JSON file. A missing file or missing keys keep their default values,
   * a file that cannot be parsed is reported and yields the defaults.
   */
  static RendererConfig LoadFromFile(const std::filesystem::path& path);

  /// Parses a configuration from a JSON string. Unknown keys are ignored.
  static std::optional<RendererConfig> Parse(std::string_view json);

  /// Applies the configured log level to the root logger.
  void ApplyLogLevel() const;
};

std::optional<WindowBackend> parse_window_backend(std::string_view name);
std::optional<Logger::Level> parse_log_level(std::string_view name);

} // namespace multirender
