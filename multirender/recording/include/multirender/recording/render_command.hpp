#pragma once

#include <multirender/math/affine.hpp>
#include <multirender/math/bez_path.hpp>
#include <multirender/math/rect.hpp>
#include <multirender/math/stroke.hpp>
#include <multirender/paint/blend_mode.hpp>
#include <multirender/paint/color.hpp>
#include <multirender/paint/font.hpp>
#include <multirender/paint/paint.hpp>
#include <multirender/paint/style.hpp>
#include <multirender/float.hpp>
#include <optional>
#include <variant>
#include <vector>

namespace multirender {

struct LayerCommand {
  BlendMode blend{};
  f32 alpha{1.0f};
  Affine transform{};
  BezPath clip{};

  bool operator==(const LayerCommand& other) const = default;
};

struct ClipCommand {
  Affine transform{};
  BezPath clip{};

  bool operator==(const ClipCommand& other) const = default;
};

struct PopLayerCommand {
  bool operator==(const PopLayerCommand& other) const = default;
};

struct StrokeCommand {
  StrokeStyle style{};
  Affine transform{};
  Paint paint{};
  std::optional<Affine> brush_transform{};
  BezPath shape{};

  bool operator==(const StrokeCommand& other) const = default;
};

struct FillCommand {
  FillRule fill{FillRule::NonZero};
  Affine transform{};
  Paint paint{};
  std::optional<Affine> brush_transform{};
  BezPath shape{};

  bool operator==(const FillCommand& other) const = default;
};

struct GlyphRunCommand {
  FontData font{};
  f32 font_size{};
  bool hint{};
  std::vector<NormalizedCoord> normalized_coords{};
  Style style{FillRule::NonZero};
  Paint paint{};
  f32 brush_alpha{1.0f};
  Affine transform{};
  std::optional<Affine> glyph_transform{};
  std::vector<Glyph> glyphs{};

  bool operator==(const GlyphRunCommand& other) const = default;
};

struct BoxShadowCommand {
  Affine transform{};
  Rect rect{};
  Color color{};
  f64 radius{};
  f64 std_dev{};

  bool operator==(const BoxShadowCommand& other) const = default;
};

using RenderCommand = std::variant<
  LayerCommand,
  ClipCommand,
  PopLayerCommand,
  StrokeCommand,
  FillCommand,
  GlyphRunCommand,
  BoxShadowCommand
>;

} // namespace multirender
