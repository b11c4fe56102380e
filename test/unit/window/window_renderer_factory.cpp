#include <multirender/window/window_renderer_factory.hpp>
#include <multirender/logger/logger.hpp>
#include <multirender/null_backend.hpp>
#include <gtest/gtest.h>
#include <SDL.h>
#include <memory>
#include <vector>

using namespace multirender;

namespace {

class LevelCountingSink final : public Logger::SinkBase {
  public:
    std::vector<Logger::Level> levels{};

  protected:
    void AppendImpl(Logger::Message const& message) override {
      levels.push_back(message.level);
    }
};

} // anonymous namespace

TEST(WindowRendererFactory, NullBackend) {
  const RendererConfig config{.backend = WindowBackend::Null};

  const std::unique_ptr<WindowRenderer> renderer = CreateCpuWindowRenderer(config);
  ASSERT_NE(renderer, nullptr);
  auto* null_renderer = dynamic_cast<NullWindowRenderer*>(renderer.get());
  ASSERT_NE(null_renderer, nullptr);

  renderer->Resume(nullptr, 8u, 8u);
  renderer->Render([](PaintScene&) {});
  EXPECT_EQ(null_renderer->GetNumberOfRenderedFrames(), 1u);
  EXPECT_EQ(GetRequiredSDLWindowFlags(config), 0u);
}

TEST(WindowRendererFactory, SoftwareBackendStartsSuspended) {
  const RendererConfig config{.backend = WindowBackend::Software};

  const std::unique_ptr<WindowRenderer> renderer = CreateCpuWindowRenderer(config);
  ASSERT_NE(renderer, nullptr);
  EXPECT_EQ(dynamic_cast<NullWindowRenderer*>(renderer.get()), nullptr);
  EXPECT_FALSE(renderer->IsActive());

  bool drawn = false;
  renderer->Render([&](PaintScene&) { drawn = true; });
  EXPECT_FALSE(drawn);
  EXPECT_EQ(GetRequiredSDLWindowFlags(config), 0u);
}

TEST(WindowRendererFactory, OpenGLBackendSelection) {
  const RendererConfig config{.backend = WindowBackend::OpenGL};
  auto sink = std::make_shared<LevelCountingSink>();
  get_logger().InstallSink(sink);

  const std::unique_ptr<WindowRenderer> renderer = CreateCpuWindowRenderer(config);
  get_logger().GetSinkCollection()->Clear();

  ASSERT_NE(renderer, nullptr);
  EXPECT_EQ(dynamic_cast<NullWindowRenderer*>(renderer.get()), nullptr);
  EXPECT_FALSE(renderer->IsActive());

#ifdef MULTIRENDER_OPENGL
  EXPECT_EQ(GetRequiredSDLWindowFlags(config), (u32)SDL_WINDOW_OPENGL);
  EXPECT_TRUE(sink->levels.empty());
#else
  // Without OpenGL support the software presenter is used, which needs no special window flags.
  EXPECT_EQ(GetRequiredSDLWindowFlags(config), 0u);
  ASSERT_EQ(sink->levels.size(), 1u);
  EXPECT_EQ(sink->levels[0], Logger::Level::Warn);
#endif
}
