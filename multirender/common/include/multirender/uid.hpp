#pragma once

#include <multirender/integer.hpp>
#include <multirender/non_copyable.hpp>

namespace multirender {

  /**
   * A 64-bit ID that is unique during the execution time of the program. Zero is never handed out,
   * so it can stand for "no object" in caches keyed by UID.
   */
  class UID : public NonCopyable {
    public:
      UID() : m_uid{Allocate()} {}

      explicit operator u64() const {
        return m_uid;
      }

      [[nodiscard]] u64 Value() const {
        return m_uid;
      }

    private:
      static u64 Allocate();

      u64 m_uid;
  };

} // namespace multirender
