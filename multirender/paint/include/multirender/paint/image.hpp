#pragma once

#include <multirender/paint/blob.hpp>
#include <multirender/paint/gradient.hpp>
#include <multirender/float.hpp>
#include <multirender/integer.hpp>
#include <memory>
#include <optional>

namespace multirender {

enum class ImageFormat : u8 {
  Rgba8,
  Bgra8
};

enum class ImageAlphaType : u8 {
  /// Color components are not multiplied by alpha.
  Alpha,
  /// Color components are already multiplied by alpha.
  AlphaPremultiplied
};

/// Sampling quality. Low uses nearest neighbour sampling, Medium and High use bilinear filtering.
enum class ImageQuality : u8 {
  Low,
  Medium,
  High
};

/**
 * Pixel data of an image, tightly packed in rows from top to bottom.
 */
struct ImageData {
  std::shared_ptr<const Blob> data{};
  ImageFormat format{ImageFormat::Rgba8};
  ImageAlphaType alpha_type{ImageAlphaType::Alpha};
  u32 width{};
  u32 height{};

  /**
   * Wraps the pixel data in an image.
   * @returns an empty optional if the data size does not match width * height * 4 bytes.
   */
  static std::optional<ImageData> Create(std::vector<u8> pixels, ImageFormat format, ImageAlphaType alpha_type, u32 width, u32 height);

  /// Interprets an existing blob as an image. Several images may share a blob with different layouts.
  static std::optional<ImageData> FromBlob(std::shared_ptr<const Blob> blob, ImageFormat format, ImageAlphaType alpha_type, u32 width, u32 height);

  /// @returns the number of bytes a valid image of this size must have
  [[nodiscard]] size_t GetExpectedSize() const {
    return (size_t)width * (size_t)height * 4u;
  }

  [[nodiscard]] bool IsValid() const {
    return data && data->Size() == GetExpectedSize();
  }

  bool operator==(const ImageData& other) const = default;
};

struct ImageSampler {
  Extend x_extend{Extend::Pad};
  Extend y_extend{Extend::Pad};
  ImageQuality quality{ImageQuality::Medium};
  f32 alpha{1.0f};

  bool operator==(const ImageSampler& other) const = default;
};

struct ImageBrush {
  ImageData image{};
  ImageSampler sampler{};

  ImageBrush() = default;
  explicit ImageBrush(ImageData image, ImageSampler sampler = {}) : image{std::move(image)}, sampler{sampler} {}

  ImageBrush& WithExtend(Extend extend) {
    sampler.x_extend = extend;
    sampler.y_extend = extend;
    return *this;
  }

  ImageBrush& WithQuality(ImageQuality quality) {
    sampler.quality = quality;
    return *this;
  }

  ImageBrush& WithAlpha(f32 alpha) {
    sampler.alpha = alpha;
    return *this;
  }

  bool operator==(const ImageBrush& other) const = default;
};

} // namespace multirender
