#include <multirender/cpu/image_cache.hpp>
#include <gtest/gtest.h>
#include <memory>

using namespace multirender;

namespace {

ImageData make_image(ImageFormat format = ImageFormat::Rgba8, ImageAlphaType alpha_type = ImageAlphaType::Alpha) {
  // One red pixel at 50% opacity (straight alpha) followed by an opaque blue one.
  return *ImageData::Create({255, 0, 0, 128, 0, 0, 255, 255}, format, alpha_type, 2u, 1u);
}

} // anonymous namespace

TEST(ImageCache, ConvertsOnceAndPremultiplies) {
  ImageCache cache{};
  const ImageData image = make_image();

  const Pixmap* pixmap = cache.GetPixmap(image);
  ASSERT_NE(pixmap, nullptr);
  EXPECT_EQ(cache.GetPixmap(image), pixmap);
  EXPECT_EQ(cache.GetNumberOfEntries(), 1u);

  EXPECT_EQ(pixmap->GetWidth(), 2u);
  EXPECT_FLOAT_EQ(pixmap->At(0, 0).r, 128.0f / 255.0f);
  EXPECT_FLOAT_EQ(pixmap->At(0, 0).a, 128.0f / 255.0f);
  EXPECT_FLOAT_EQ(pixmap->At(1, 0).b, 1.0f);
}

TEST(ImageCache, ImagesSharingABlobShareAnEntry) {
  ImageCache cache{};
  const ImageData image = make_image();
  const ImageData copy = image;

  EXPECT_EQ(cache.GetPixmap(image), cache.GetPixmap(copy));
  EXPECT_EQ(cache.GetNumberOfEntries(), 1u);

  cache.GetPixmap(make_image());
  EXPECT_EQ(cache.GetNumberOfEntries(), 1u) << "the temporary image was destroyed and must have been evicted";
}

TEST(ImageCache, EntryIsEvictedWhenBlobIsDestroyed) {
  ImageCache cache{};
  ImageData image = make_image();
  std::weak_ptr<const Blob> blob = image.data;

  cache.GetPixmap(image);
  EXPECT_EQ(blob.lock()->OnBeforeDestruct().GetNumberOfSubscriptions(), 1u);

  image.data.reset();
  EXPECT_TRUE(blob.expired());
  EXPECT_EQ(cache.GetNumberOfEntries(), 0u);
}

TEST(ImageCache, ReinterpretedLayoutIsReconverted) {
  ImageCache cache{};
  const ImageData rgba = make_image();
  ImageData bgra = rgba;
  bgra.format = ImageFormat::Bgra8;

  EXPECT_FLOAT_EQ(cache.GetPixmap(rgba)->At(1, 0).b, 1.0f);
  EXPECT_FLOAT_EQ(cache.GetPixmap(bgra)->At(1, 0).r, 1.0f);
  EXPECT_FLOAT_EQ(cache.GetPixmap(bgra)->At(1, 0).b, 0.0f);
  EXPECT_EQ(cache.GetNumberOfEntries(), 1u);
}

TEST(ImageCache, PremultipliedInputIsKept) {
  ImageCache cache{};
  const ImageData image = make_image(ImageFormat::Rgba8, ImageAlphaType::AlphaPremultiplied);

  // Color components larger than alpha are clamped to alpha.
  EXPECT_FLOAT_EQ(cache.GetPixmap(image)->At(0, 0).r, 128.0f / 255.0f);
}

TEST(ImageCache, InvalidImagesAreRejected) {
  ImageCache cache{};
  EXPECT_EQ(cache.GetPixmap(ImageData{}), nullptr);

  ImageData wrong_size = make_image();
  wrong_size.width = 3u;
  EXPECT_EQ(cache.GetPixmap(wrong_size), nullptr);
  EXPECT_EQ(cache.GetNumberOfEntries(), 0u);
}

TEST(ImageCache, ClearUnsubscribesFromBlobs) {
  const ImageData image = make_image();
  {
    ImageCache cache{};
    cache.GetPixmap(image);
    cache.Clear();
    EXPECT_EQ(cache.GetNumberOfEntries(), 0u);
    EXPECT_EQ(image.data->OnBeforeDestruct().GetNumberOfSubscriptions(), 0u);

    cache.GetPixmap(image);
  }
  // The cache is gone, destroying the blob later must not call back into it.
  EXPECT_EQ(image.data->OnBeforeDestruct().GetNumberOfSubscriptions(), 0u);
}
