#pragma once

#include <multirender/logger/logger.hpp>

namespace multirender {

/**
 * Logs messages to the console, colored by level. Warnings and everything more severe go to
 * stderr, the rest to stdout.
 */
class LoggerConsoleSink final : public Logger::SinkBase {
  public:
    explicit LoggerConsoleSink(bool colored = true) : m_colored{colored} {}

  protected:
    void AppendImpl(Logger::Message const& message) override;

  private:
    bool m_colored;
};

} // namespace multirender
