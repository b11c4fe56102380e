#include <multirender/logger/sink/console.hpp>
#include <fmt/color.h>
#include <cstdio>

namespace multirender {

  static fmt::text_style get_level_style(Logger::Level level) {
    switch(level) {
      case Logger::Level::Trace: return fmt::fg(fmt::color::gray);
      case Logger::Level::Debug: return fmt::fg(fmt::color::cyan);
      case Logger::Level::Info:  return fmt::fg(fmt::color::white);
      case Logger::Level::Warn:  return fmt::fg(fmt::color::yellow);
      case Logger::Level::Error: return fmt::fg(fmt::color::red);
      case Logger::Level::Fatal: return fmt::fg(fmt::color::magenta) | fmt::emphasis::bold;
    }
    return {};
  }

  void LoggerConsoleSink::AppendImpl(Logger::Message const& message) {
    std::FILE* stream = message.level >= Logger::Level::Warn ? stderr : stdout;
    const fmt::text_style style = m_colored ? get_level_style(message.level) : fmt::text_style{};

    fmt::print(stream, style, "[{}] {}: {}\n", get_log_level_name(message.level), message.logger_name, message.text);
  }

} // namespace multirender
