#pragma once

#include <multirender/cpu/pixmap.hpp>
#include <multirender/paint/image.hpp>
#include <multirender/integer.hpp>
#include <multirender/non_copyable.hpp>
#include <EASTL/hash_map.h>

namespace multirender {

/**
 * Keeps the premultiplied pixmap of every image that has been drawn, keyed by the ID of the blob
 * holding the image pixels. An entry is evicted as soon as its blob is destroyed.
 */
class ImageCache : public NonCopyable {
  public:
    ImageCache() = default;
   ~ImageCache();

    /**
     * Returns the pixmap for `image`, converting the pixel data on first use.
     * @returns nullptr for images without (or with malformed) pixel data
     */
    const Pixmap* GetPixmap(const ImageData& image);

    /// Evicts all entries.
    void Clear();

    [[nodiscard]] size_t GetNumberOfEntries() const {
      return m_entries.size();
    }

  private:
    struct Entry {
      const Blob* blob{};
      VoidEvent::SubID destruct_event_subscription{};
      ImageFormat format{};
      ImageAlphaType alpha_type{};
      Pixmap pixmap{};
    };

    void Evict(u64 blob_id);

    eastl::hash_map<u64, Entry> m_entries{};
};

} // namespace multirender
