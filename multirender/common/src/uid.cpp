#include <multirender/panic.hpp>
#include <multirender/uid.hpp>
#include <atomic>

namespace multirender {

  static std::atomic<u64> g_next_uid = 1ull;

  u64 UID::Allocate() {
    const u64 uid = g_next_uid.fetch_add(1u, std::memory_order_relaxed);

    if(uid == 0ull) [[unlikely]] {
      MULTIRENDER_PANIC("UID: all 2^64 IDs have been allocated");
    }

    return uid;
  }

} // namespace multirender
