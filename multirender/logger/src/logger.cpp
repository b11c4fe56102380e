#include <multirender/logger/logger.hpp>
#include <unordered_map>

namespace multirender {

  Logger& get_logger() {
    static Logger logger{"MultiRender"};

    return logger;
  }

  Logger& get_named_logger(std::string const& name) {
    static std::unordered_map<std::string, Logger> registry;
    static std::mutex registry_mutex;

    std::lock_guard lock{registry_mutex};

    if(!registry.contains(name)) {
      auto sink_collection = std::make_shared<Logger::SinkCollection>();
      sink_collection->Install(get_logger().GetSinkCollection());
      registry[name] = Logger{sink_collection, name};
    }

    return registry[name];
  }

  const char* get_log_level_name(Logger::Level level) {
    switch(level) {
      case Logger::Level::Trace: return "trace";
      case Logger::Level::Debug: return "debug";
      case Logger::Level::Info:  return "info";
      case Logger::Level::Warn:  return "warn";
      case Logger::Level::Error: return "error";
      case Logger::Level::Fatal: return "fatal";
    }
    return "unknown";
  }

} // namespace multirender
