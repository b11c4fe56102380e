#pragma once

#include <multirender/math/bez_path.hpp>
#include <multirender/paint/font.hpp>
#include <multirender/float.hpp>
#include <multirender/integer.hpp>
#include <optional>
#include <span>

namespace multirender {

/**
 * Supplies glyph outlines to the CPU backend, which does not parse fonts on its own.
 */
class GlyphOutlineProvider {
  public:
    virtual ~GlyphOutlineProvider() = default;

    /**
     * @returns the outline of glyph `glyph_id` scaled to `font_size` pixels per em, with the origin
     *          on the baseline and y pointing down, or an empty optional if the glyph is unavailable
     */
    virtual std::optional<BezPath> GetGlyphOutline(
      const FontData& font,
      u32 glyph_id,
      f32 font_size,
      bool hint,
      std::span<const NormalizedCoord> normalized_coords
    ) = 0;
};

} // namespace multirender
