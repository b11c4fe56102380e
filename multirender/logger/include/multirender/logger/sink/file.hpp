#pragma once

#include <multirender/logger/logger.hpp>
#include <filesystem>
#include <fstream>

namespace multirender {

/// Appends uncolored messages to a text file
class LoggerFileSink final : public Logger::SinkBase {
  public:
    explicit LoggerFileSink(const std::filesystem::path& path);

    [[nodiscard]] bool IsOpen() const {
      return m_file.is_open();
    }

  protected:
    void AppendImpl(Logger::Message const& message) override;

  private:
    std::ofstream m_file;
};

} // namespace multirender
