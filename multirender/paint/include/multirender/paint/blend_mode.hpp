#pragma once

#include <multirender/integer.hpp>

namespace multirender {

/// How source and destination colors are mixed before compositing.
enum class Mix : u8 {
  Normal,
  Multiply,
  Screen,
  Overlay,
  Darken,
  Lighten,
  ColorDodge,
  ColorBurn,
  HardLight,
  SoftLight,
  Difference,
  Exclusion,
  Hue,
  Saturation,
  Color,
  Luminosity,
  /// Layer is only used for clipping. Composites like Normal.
  Clip
};

/// Porter-Duff compositing operator applied after mixing.
enum class Compose : u8 {
  Clear,
  Copy,
  Dest,
  SrcOver,
  DestOver,
  SrcIn,
  DestIn,
  SrcOut,
  DestOut,
  SrcAtop,
  DestAtop,
  Xor,
  Plus,
  PlusLighter
};

struct BlendMode {
  Mix mix{Mix::Normal};
  Compose compose{Compose::SrcOver};

  constexpr BlendMode() = default;
  constexpr BlendMode(Mix mix, Compose compose) : mix{mix}, compose{compose} {}
  constexpr BlendMode(Mix mix) : mix{mix} {} // NOLINT(google-explicit-constructor)
  constexpr BlendMode(Compose compose) : compose{compose} {} // NOLINT(google-explicit-constructor)

  bool operator==(const BlendMode& other) const = default;
};

} // namespace multirender
