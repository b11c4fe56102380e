#include <multirender/cpu/image_cache.hpp>
#include <multirender/logger/logger.hpp>
#include <functional>

namespace multirender {

ImageCache::~ImageCache() {
  // Blobs that outlive this cache must not call back into it.
  Clear();
}

const Pixmap* ImageCache::GetPixmap(const ImageData& image) {
  if(!image.IsValid()) {
    return nullptr;
  }

  const Blob* blob = image.data.get();
  const u64 blob_id = blob->GetID();

  const auto match = m_entries.find(blob_id);
  if(match != m_entries.end()) {
    Entry& entry = match->second;

    const Pixmap& pixmap = entry.pixmap;
    if(entry.format == image.format && entry.alpha_type == image.alpha_type &&
       pixmap.GetWidth() == image.width && pixmap.GetHeight() == image.height) {
      return &pixmap;
    }

    // The same pixels were reinterpreted with a different layout.
    entry.format = image.format;
    entry.alpha_type = image.alpha_type;
    entry.pixmap = Pixmap::FromImage(image);
    return &entry.pixmap;
  }

  Entry& entry = m_entries[blob_id];
  entry.blob = blob;
  entry.format = image.format;
  entry.alpha_type = image.alpha_type;
  entry.pixmap = Pixmap::FromImage(image);
  entry.destruct_event_subscription = blob->OnBeforeDestruct().Subscribe(std::bind(&ImageCache::Evict, this, blob_id));

  MULTIRENDER_TRACE("ImageCache: converted {}x{} image (blob {})", image.width, image.height, blob_id);
  return &entry.pixmap;
}

void ImageCache::Clear() {
  for(const auto& [blob_id, entry] : m_entries) {
    entry.blob->OnBeforeDestruct().Unsubscribe(entry.destruct_event_subscription);
  }
  m_entries.clear();
}

void ImageCache::Evict(u64 blob_id) {
  m_entries.erase(blob_id);
}

} // namespace multirender
