#include <multirender/logger/sink/console.hpp>
#include <multirender/logger/logger.hpp>
#include <multirender/config.hpp>

#include "main_window.hpp"

int main(int argc, char** argv) {
  multirender::get_logger().InstallSink(std::make_shared<multirender::LoggerConsoleSink>());

  const char* config_path = argc > 1 ? argv[1] : "multirender.json";
  multirender::RendererConfig config = multirender::RendererConfig::LoadFromFile(config_path);
  config.ApplyLogLevel();

  multirender::MainWindow{std::move(config)}.Run();
  return 0;
}
