#include <multirender/logger/sink/file.hpp>

namespace multirender {

  LoggerFileSink::LoggerFileSink(const std::filesystem::path& path) : m_file{path, std::ios::out | std::ios::app} {
  }

  void LoggerFileSink::AppendImpl(Logger::Message const& message) {
    if(!m_file.is_open()) {
      return;
    }
    m_file << fmt::format("[{}] {}: {} ({}:{})\n", get_log_level_name(message.level), message.logger_name, message.text, message.file, message.line);
    m_file.flush();
  }

} // namespace multirender
