#pragma once

#include <multirender/paint/blob.hpp>
#include <multirender/float.hpp>
#include <multirender/integer.hpp>
#include <memory>

namespace multirender {

/// Variation axis coordinate in the normalized F2Dot14 representation of OpenType.
using NormalizedCoord = i16;

/// A font file and the index of the face within it (for font collections).
struct FontData {
  std::shared_ptr<const Blob> data{};
  u32 index{};

  bool operator==(const FontData& other) const = default;
};

/// A positioned glyph. Coordinates are relative to the transform of the glyph run.
struct Glyph {
  u32 id{};
  f32 x{};
  f32 y{};

  bool operator==(const Glyph& other) const = default;
};

} // namespace multirender
