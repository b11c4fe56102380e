#include <multirender/cpu/cpu_image_renderer.hpp>
#include <multirender/logger/sink/console.hpp>
#include <multirender/logger/sink/file.hpp>
#include <multirender/logger/logger.hpp>
#include <multirender/serialize/scene_archive.hpp>
#include <multirender/config.hpp>
#include <CLI/CLI.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

using namespace multirender;

/**
 * render-tool
 *
 * Renders a serialized scene directory with the CPU backend and writes the result as a PNG file.
 * Optionally the scene is serialized again, which is useful to reformat scene files.
 */
int main(int argc, char** argv) {
  CLI::App app{"render-tool - render serialized MultiRender scenes"};

  std::filesystem::path scene_path;
  std::filesystem::path output_path;
  std::filesystem::path dump_path;
  std::filesystem::path config_path;
  std::filesystem::path log_path;
  u32 width = 512u;
  u32 height = 512u;
  size_t max_depth = 3u;
  bool verbose = false;

  app.add_option("scene", scene_path, "Directory holding scene.json and its resources")
    ->required()
    ->check(CLI::ExistingDirectory);

  app.add_option("-o,--output", output_path, "PNG file to write");

  app.add_option("-W,--width", width, "Width of the rendered image")
    ->check(CLI::PositiveNumber);

  app.add_option("-H,--height", height, "Height of the rendered image")
    ->check(CLI::PositiveNumber);

  app.add_option("-c,--config", config_path, "Renderer configuration file (JSON)")
    ->check(CLI::ExistingFile);

  auto dump_option = app.add_option("--dump", dump_path, "Serialize the loaded scene again into this directory");

  app.add_option("--max-depth", max_depth, "Nesting depth up to which the dumped scene.json is pretty printed")
    ->needs(dump_option);

  app.add_option("--log-file", log_path, "Also append log messages to this file");

  app.add_flag("-v,--verbose", verbose, "Enable debug logging");

  CLI11_PARSE(app, argc, argv);

  get_logger().InstallSink(std::make_shared<LoggerConsoleSink>());
  if(!log_path.empty()) {
    auto file_sink = std::make_shared<LoggerFileSink>(log_path);
    if(!file_sink->IsOpen()) {
      MULTIRENDER_ERROR("Failed to open log file '{}'", log_path.string());
      return 1;
    }
    get_logger().InstallSink(file_sink);
  }

  RendererConfig config{};
  if(!config_path.empty()) {
    config = RendererConfig::LoadFromFile(config_path);
  }
  if(verbose) {
    config.log_level = Logger::Level::Debug;
  }
  config.ApplyLogLevel();

  if(output_path.empty() && dump_path.empty()) {
    MULTIRENDER_ERROR("Nothing to do: pass --output and/or --dump");
    return 1;
  }

  const std::optional<SceneArchive> archive = SceneArchive::ReadFromDirectory(scene_path);
  if(!archive.has_value()) {
    return 1;
  }

  const std::optional<Scene> scene = SceneDeserializer{}.Deserialize(*archive);
  if(!scene.has_value()) {
    return 1;
  }

  MULTIRENDER_INFO("Loaded scene with {} commands", scene->GetCommands().size());

  if(!dump_path.empty()) {
    const SceneArchive dumped = SceneSerializer{}.Serialize(*scene);
    if(!dumped.WriteToDirectory(dump_path, app.count("--max-depth") > 0u ? max_depth : config.serialize_max_depth)) {
      return 1;
    }
    MULTIRENDER_INFO("Wrote scene to {}", dump_path.string());
  }

  if(!output_path.empty()) {
    CpuImageRenderer renderer{width, height, config.tolerance};

    std::vector<u8> pixels{};
    if(!renderer.RenderToVector([&](PaintScene& painter) { scene->RenderTo(painter); }, pixels)) {
      return 1;
    }

    if(stbi_write_png(output_path.string().c_str(), (int)width, (int)height, 4, pixels.data(), (int)width * 4) == 0) {
      MULTIRENDER_ERROR("Failed to write {}", output_path.string());
      return 1;
    }
    MULTIRENDER_INFO("Wrote {}x{} image to {}", width, height, output_path.string());
  }

  return 0;
}
