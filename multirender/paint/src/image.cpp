#include <multirender/paint/image.hpp>
#include <multirender/logger/logger.hpp>

namespace multirender {

std::optional<ImageData> ImageData::Create(std::vector<u8> pixels, ImageFormat format, ImageAlphaType alpha_type, u32 width, u32 height) {
  return FromBlob(Blob::Create(std::move(pixels)), format, alpha_type, width, height);
}

std::optional<ImageData> ImageData::FromBlob(std::shared_ptr<const Blob> blob, ImageFormat format, ImageAlphaType alpha_type, u32 width, u32 height) {
  ImageData image{
    .data = std::move(blob),
    .format = format,
    .alpha_type = alpha_type,
    .width = width,
    .height = height
  };

  const size_t size = image.data ? image.data->Size() : 0u;
  if(size != image.GetExpectedSize()) {
    MULTIRENDER_ERROR("ImageData: expected {} bytes for a {}x{} image but got {}", image.GetExpectedSize(), width, height, size);
    return std::nullopt;
  }

  return image;
}

} // namespace multirender
