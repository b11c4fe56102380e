#pragma once

#include <multirender/integer.hpp>
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace multirender {

class Logger {
  public:
    enum class Level : u8 {
      Trace,
      Debug,
      Info,
      Warn,
      Error,
      Fatal
    };

    struct Message {
      Level level;
      std::string_view logger_name;
      std::string_view text;
      const char* file;
      int line;
    };

    class SinkBase {
      public:
        virtual ~SinkBase() = default;

        void Append(Message const& message) {
          if(message.level >= m_minimum_level) {
            AppendImpl(message);
          }
        }

        void SetMinimumLevel(Level level) {
          m_minimum_level = level;
        }

      protected:
        virtual void AppendImpl(Message const& message) = 0;

      private:
        Level m_minimum_level{Level::Trace};
    };

    /// Forwards each message to every installed sink. A collection may be installed into another collection.
    class SinkCollection final : public SinkBase {
      public:
        void Install(std::shared_ptr<SinkBase> sink) {
          std::lock_guard lock{m_mutex};
          m_sinks.push_back(std::move(sink));
        }

        void Clear() {
          std::lock_guard lock{m_mutex};
          m_sinks.clear();
        }

      protected:
        void AppendImpl(Message const& message) override {
          std::lock_guard lock{m_mutex};
          for(const auto& sink : m_sinks) {
            sink->Append(message);
          }
        }

      private:
        std::recursive_mutex m_mutex{};
        std::vector<std::shared_ptr<SinkBase>> m_sinks{};
    };

    Logger() : Logger{"MultiRender"} {}

    explicit Logger(std::string name)
        : m_sink_collection{std::make_shared<SinkCollection>()}
        , m_name{std::move(name)} {
    }

    Logger(std::shared_ptr<SinkCollection> sink_collection, std::string name)
        : m_sink_collection{std::move(sink_collection)}
        , m_name{std::move(name)} {
    }

    void InstallSink(std::shared_ptr<SinkBase> sink) {
      m_sink_collection->Install(std::move(sink));
    }

    [[nodiscard]] const std::shared_ptr<SinkCollection>& GetSinkCollection() const {
      return m_sink_collection;
    }

    [[nodiscard]] const std::string& GetName() const {
      return m_name;
    }

    [[nodiscard]] Level GetMinimumLevel() const {
      return m_minimum_level;
    }

    void SetMinimumLevel(Level level) {
      m_minimum_level = level;
    }

    template<typename... Args>
    void Log(Level level, const char* file, int line, fmt::format_string<Args...> format, Args&&... args) {
      if(level < m_minimum_level) {
        return;
      }

      const std::string text = fmt::format(format, std::forward<Args>(args)...);

      m_sink_collection->Append({
        .level = level,
        .logger_name = m_name,
        .text = text,
        .file = file,
        .line = line
      });
    }

  private:
    std::shared_ptr<SinkCollection> m_sink_collection;
    std::string m_name;
    Level m_minimum_level{Level::Trace};
};

/// @returns the process-wide root logger
Logger& get_logger();

/// @returns a logger tagged with the given name which writes to the sinks of the root logger
Logger& get_named_logger(std::string const& name);

/// @returns the lower-case name of a log level ("trace", "debug", ...)
const char* get_log_level_name(Logger::Level level);

} // namespace multirender

#define MULTIRENDER_LOG(level, format, ...) multirender::get_logger().Log(level, __FILE__, __LINE__, format, ## __VA_ARGS__)

#define MULTIRENDER_TRACE(format, ...) MULTIRENDER_LOG(multirender::Logger::Level::Trace, format, ## __VA_ARGS__)
#define MULTIRENDER_DEBUG(format, ...) MULTIRENDER_LOG(multirender::Logger::Level::Debug, format, ## __VA_ARGS__)
#define MULTIRENDER_INFO(format, ...)  MULTIRENDER_LOG(multirender::Logger::Level::Info,  format, ## __VA_ARGS__)
#define MULTIRENDER_WARN(format, ...)  MULTIRENDER_LOG(multirender::Logger::Level::Warn,  format, ## __VA_ARGS__)
#define MULTIRENDER_ERROR(format, ...) MULTIRENDER_LOG(multirender::Logger::Level::Error, format, ## __VA_ARGS__)
#define MULTIRENDER_FATAL(format, ...) MULTIRENDER_LOG(multirender::Logger::Level::Fatal, format, ## __VA_ARGS__)
