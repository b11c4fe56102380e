#include <multirender/cpu/blend.hpp>
#include <algorithm>
#include <cmath>

namespace multirender {

namespace {

struct Rgb {
  f32 r;
  f32 g;
  f32 b;
};

f32 screen(f32 cb, f32 cs) {
  return cb + cs - cb * cs;
}

f32 hard_light(f32 cb, f32 cs) {
  if(cs <= 0.5f) {
    return cb * 2.0f * cs;
  }
  return screen(cb, 2.0f * cs - 1.0f);
}

f32 color_dodge(f32 cb, f32 cs) {
  if(cb == 0.0f) return 0.0f;
  if(cs >= 1.0f) return 1.0f;
  return std::min(1.0f, cb / (1.0f - cs));
}

f32 color_burn(f32 cb, f32 cs) {
  if(cb >= 1.0f) return 1.0f;
  if(cs <= 0.0f) return 0.0f;
  return 1.0f - std::min(1.0f, (1.0f - cb) / cs);
}

f32 soft_light(f32 cb, f32 cs) {
  if(cs <= 0.5f) {
    return cb - (1.0f - 2.0f * cs) * cb * (1.0f - cb);
  }
  const f32 d = cb <= 0.25f ? ((16.0f * cb - 12.0f) * cb + 4.0f) * cb : std::sqrt(cb);
  return cb + (2.0f * cs - 1.0f) * (d - cb);
}

f32 blend_separable(Mix mix, f32 cb, f32 cs) {
  switch(mix) {
    case Mix::Multiply:   return cb * cs;
    case Mix::Screen:     return screen(cb, cs);
    case Mix::Overlay:    return hard_light(cs, cb);
    case Mix::Darken:     return std::min(cb, cs);
    case Mix::Lighten:    return std::max(cb, cs);
    case Mix::ColorDodge: return color_dodge(cb, cs);
    case Mix::ColorBurn:  return color_burn(cb, cs);
    case Mix::HardLight:  return hard_light(cb, cs);
    case Mix::SoftLight:  return soft_light(cb, cs);
    case Mix::Difference: return std::abs(cb - cs);
    case Mix::Exclusion:  return cb + cs - 2.0f * cb * cs;
    default:              return cs;
  }
}

f32 lum(const Rgb& c) {
  return 0.3f * c.r + 0.59f * c.g + 0.11f * c.b;
}

f32 sat(const Rgb& c) {
  return std::max({c.r, c.g, c.b}) - std::min({c.r, c.g, c.b});
}

Rgb clip_color(const Rgb& c) {
  const f32 l = lum(c);
  const f32 n = std::min({c.r, c.g, c.b});
  const f32 x = std::max({c.r, c.g, c.b});
  Rgb result = c;

  if(n < 0.0f) {
    const f32 scale = l / (l - n);
    result = {l + (result.r - l) * scale, l + (result.g - l) * scale, l + (result.b - l) * scale};
  }
  if(x > 1.0f) {
    const f32 scale = (1.0f - l) / (x - l);
    result = {l + (result.r - l) * scale, l + (result.g - l) * scale, l + (result.b - l) * scale};
  }
  return result;
}

Rgb set_lum(const Rgb& c, f32 l) {
  const f32 d = l - lum(c);
  return clip_color({c.r + d, c.g + d, c.b + d});
}

Rgb set_sat(const Rgb& c, f32 s) {
  const f32 n = std::min({c.r, c.g, c.b});
  const f32 x = std::max({c.r, c.g, c.b});
  if(x <= n) {
    return {0.0f, 0.0f, 0.0f};
  }
  const f32 scale = s / (x - n);
  return {(c.r - n) * scale, (c.g - n) * scale, (c.b - n) * scale};
}

Rgb blend_non_separable(Mix mix, const Rgb& cb, const Rgb& cs) {
  switch(mix) {
    case Mix::Hue:        return set_lum(set_sat(cs, sat(cb)), lum(cb));
    case Mix::Saturation: return set_lum(set_sat(cb, sat(cs)), lum(cb));
    case Mix::Color:      return set_lum(cs, lum(cb));
    case Mix::Luminosity: return set_lum(cb, lum(cs));
    default:              return cs;
  }
}

bool is_non_separable(Mix mix) {
  return mix == Mix::Hue || mix == Mix::Saturation || mix == Mix::Color || mix == Mix::Luminosity;
}

/// Applies the mix function and returns the premultiplied source color that takes part in composition.
PremulColor mix(const PremulColor& src, const PremulColor& dst, Mix mode) {
  if(mode == Mix::Normal || mode == Mix::Clip || src.a <= 0.0f) {
    return src;
  }

  const Rgb cs{src.r / src.a, src.g / src.a, src.b / src.a};
  const Rgb cb = dst.a > 0.0f ? Rgb{dst.r / dst.a, dst.g / dst.a, dst.b / dst.a} : Rgb{0.0f, 0.0f, 0.0f};

  Rgb mixed{};
  if(is_non_separable(mode)) {
    mixed = blend_non_separable(mode, cb, cs);
  } else {
    mixed = {blend_separable(mode, cb.r, cs.r), blend_separable(mode, cb.g, cs.g), blend_separable(mode, cb.b, cs.b)};
  }

  // Where the backdrop is transparent the source color shows through unchanged.
  const f32 ab = dst.a;
  const Rgb result{
    (1.0f - ab) * cs.r + ab * std::clamp(mixed.r, 0.0f, 1.0f),
    (1.0f - ab) * cs.g + ab * std::clamp(mixed.g, 0.0f, 1.0f),
    (1.0f - ab) * cs.b + ab * std::clamp(mixed.b, 0.0f, 1.0f)
  };
  return {result.r * src.a, result.g * src.a, result.b * src.a, src.a};
}

} // anonymous namespace

PremulColor blend(const PremulColor& src, const PremulColor& dst, const BlendMode& mode) {
  const PremulColor s = mix(src, dst, mode.mix);

  f32 fa = 0.0f;
  f32 fb = 0.0f;

  switch(mode.compose) {
    case Compose::Clear:    fa = 0.0f;         fb = 0.0f;         break;
    case Compose::Copy:     fa = 1.0f;         fb = 0.0f;         break;
    case Compose::Dest:     fa = 0.0f;         fb = 1.0f;         break;
    case Compose::SrcOver:  return blend_src_over(s, dst);
    case Compose::DestOver: fa = 1.0f - dst.a; fb = 1.0f;         break;
    case Compose::SrcIn:    fa = dst.a;        fb = 0.0f;         break;
    case Compose::DestIn:   fa = 0.0f;         fb = s.a;          break;
    case Compose::SrcOut:   fa = 1.0f - dst.a; fb = 0.0f;         break;
    case Compose::DestOut:  fa = 0.0f;         fb = 1.0f - s.a;   break;
    case Compose::SrcAtop:  fa = dst.a;        fb = 1.0f - s.a;   break;
    case Compose::DestAtop: fa = 1.0f - dst.a; fb = s.a;          break;
    case Compose::Xor:      fa = 1.0f - dst.a; fb = 1.0f - s.a;   break;
    case Compose::Plus:
    case Compose::PlusLighter: {
      return {
        std::min(s.r + dst.r, 1.0f),
        std::min(s.g + dst.g, 1.0f),
        std::min(s.b + dst.b, 1.0f),
        std::min(s.a + dst.a, 1.0f)
      };
    }
  }

  return {s.r * fa + dst.r * fb, s.g * fa + dst.g * fb, s.b * fa + dst.b * fb, s.a * fa + dst.a * fb};
}

} // namespace multirender
