#pragma once

#include <multirender/event.hpp>
#include <multirender/integer.hpp>
#include <multirender/non_copyable.hpp>
#include <multirender/uid.hpp>
#include <memory>
#include <span>
#include <vector>

namespace multirender {

/**
 * An immutable byte buffer shared between paints, fonts and the caches of render backends.
 * Each blob carries a process-unique ID that backends use as a cache key.
 */
class Blob : NonCopyable, NonMoveable {
  public:
    explicit Blob(std::vector<u8> data) : m_data{std::move(data)} {}

   ~Blob() {
      OnBeforeDestruct().Emit();
    }

    static std::shared_ptr<const Blob> Create(std::vector<u8> data) {
      return std::make_shared<const Blob>(std::move(data));
    }

    [[nodiscard]] u64 GetID() const {
      return m_uid.Value();
    }

    [[nodiscard]] std::span<const u8> Data() const {
      return m_data;
    }

    [[nodiscard]] size_t Size() const {
      return m_data.size();
    }

    /// @returns an event that is fired right before the blob is destroyed.
    VoidEvent& OnBeforeDestruct() const {
      return m_on_before_destruct;
    }

  private:
    UID m_uid{};
    std::vector<u8> m_data;
    mutable VoidEvent m_on_before_destruct{};
};

} // namespace multirender
