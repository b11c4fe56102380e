#pragma once

#include <multirender/math/affine.hpp>
#include <multirender/math/bez_path.hpp>
#include <multirender/math/point.hpp>
#include <multirender/math/rect.hpp>
#include <multirender/math/stroke.hpp>
#include <multirender/paint/blend_mode.hpp>
#include <multirender/paint/color.hpp>
#include <multirender/paint/gradient.hpp>
#include <multirender/paint/image.hpp>
#include <multirender/paint/style.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace multirender::detail {

template<typename E, size_t N>
struct EnumNameTable {
  std::array<std::pair<E, std::string_view>, N> entries;

  [[nodiscard]] std::string ToString(E value) const {
    for(const auto& [entry_value, name] : entries) {
      if(entry_value == value) {
        return std::string{name};
      }
    }
    return "unknown";
  }

  [[nodiscard]] std::optional<E> FromString(std::string_view name) const {
    for(const auto& [entry_value, entry_name] : entries) {
      if(entry_name == name) {
        return entry_value;
      }
    }
    return std::nullopt;
  }
};

inline constexpr EnumNameTable<Mix, 17> k_mix_names{{{
  {Mix::Normal, "normal"},
  {Mix::Multiply, "multiply"},
  {Mix::Screen, "screen"},
  {Mix::Overlay, "overlay"},
  {Mix::Darken, "darken"},
  {Mix::Lighten, "lighten"},
  {Mix::ColorDodge, "color_dodge"},
  {Mix::ColorBurn, "color_burn"},
  {Mix::HardLight, "hard_light"},
  {Mix::SoftLight, "soft_light"},
  {Mix::Difference, "difference"},
  {Mix::Exclusion, "exclusion"},
  {Mix::Hue, "hue"},
  {Mix::Saturation, "saturation"},
  {Mix::Color, "color"},
  {Mix::Luminosity, "luminosity"},
  {Mix::Clip, "clip"}
}}};

inline constexpr EnumNameTable<Compose, 14> k_compose_names{{{
  {Compose::Clear, "clear"},
  {Compose::Copy, "copy"},
  {Compose::Dest, "dest"},
  {Compose::SrcOver, "src_over"},
  {Compose::DestOver, "dest_over"},
  {Compose::SrcIn, "src_in"},
  {Compose::DestIn, "dest_in"},
  {Compose::SrcOut, "src_out"},
  {Compose::DestOut, "dest_out"},
  {Compose::SrcAtop, "src_atop"},
  {Compose::DestAtop, "dest_atop"},
  {Compose::Xor, "xor"},
  {Compose::Plus, "plus"},
  {Compose::PlusLighter, "plus_lighter"}
}}};

inline constexpr EnumNameTable<FillRule, 2> k_fill_rule_names{{{
  {FillRule::NonZero, "non_zero"},
  {FillRule::EvenOdd, "even_odd"}
}}};

inline constexpr EnumNameTable<Join, 3> k_join_names{{{
  {Join::Bevel, "bevel"},
  {Join::Miter, "miter"},
  {Join::Round, "round"}
}}};

inline constexpr EnumNameTable<Cap, 3> k_cap_names{{{
  {Cap::Butt, "butt"},
  {Cap::Square, "square"},
  {Cap::Round, "round"}
}}};

inline constexpr EnumNameTable<Extend, 3> k_extend_names{{{
  {Extend::Pad, "pad"},
  {Extend::Repeat, "repeat"},
  {Extend::Reflect, "reflect"}
}}};

inline constexpr EnumNameTable<ImageQuality, 3> k_image_quality_names{{{
  {ImageQuality::Low, "low"},
  {ImageQuality::Medium, "medium"},
  {ImageQuality::High, "high"}
}}};

inline constexpr EnumNameTable<ImageFormat, 2> k_image_format_names{{{
  {ImageFormat::Rgba8, "rgba8"},
  {ImageFormat::Bgra8, "bgra8"}
}}};

inline constexpr EnumNameTable<ImageAlphaType, 2> k_image_alpha_type_names{{{
  {ImageAlphaType::Alpha, "alpha"},
  {ImageAlphaType::AlphaPremultiplied, "alpha_premultiplied"}
}}};

inline nlohmann::ordered_json to_json(const Affine& affine) {
  const auto& c = affine.Coefficients();
  return nlohmann::ordered_json::array({c[0], c[1], c[2], c[3], c[4], c[5]});
}

inline nlohmann::ordered_json to_json(const Point& point) {
  return nlohmann::ordered_json::array({point.x, point.y});
}

inline nlohmann::ordered_json to_json(const Rect& rect) {
  return nlohmann::ordered_json::array({rect.x0, rect.y0, rect.x1, rect.y1});
}

inline nlohmann::ordered_json to_json(const Color& color) {
  return nlohmann::ordered_json::array({color.r, color.g, color.b, color.a});
}

inline nlohmann::ordered_json to_json(const std::optional<Affine>& affine) {
  if(!affine.has_value()) {
    return nullptr;
  }
  return to_json(*affine);
}

/// The readers below throw nlohmann::json::exception on type mismatches; the deserializer reports those.

inline Affine affine_from_json(const nlohmann::ordered_json& json) {
  const auto c = json.get<std::array<f64, 6>>();
  return Affine{c};
}

inline std::optional<Affine> optional_affine_from_json(const nlohmann::ordered_json& json) {
  if(json.is_null()) {
    return std::nullopt;
  }
  return affine_from_json(json);
}

inline Point point_from_json(const nlohmann::ordered_json& json) {
  const auto p = json.get<std::array<f64, 2>>();
  return {p[0], p[1]};
}

inline Rect rect_from_json(const nlohmann::ordered_json& json) {
  const auto r = json.get<std::array<f64, 4>>();
  return {r[0], r[1], r[2], r[3]};
}

inline Color color_from_json(const nlohmann::ordered_json& json) {
  const auto c = json.get<std::array<f32, 4>>();
  return {c[0], c[1], c[2], c[3]};
}

} // namespace multirender::detail
