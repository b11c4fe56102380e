#pragma once

namespace multirender {

  class NonCopyable {
    public:
      NonCopyable() = default;
      NonCopyable(const NonCopyable&) = delete;

      NonCopyable& operator=(const NonCopyable&) = delete;
  };

  /// Pins an object to its address, for objects that hand out pointers to themselves (e.g. to event handlers).
  class NonMoveable {
    public:
      NonMoveable() = default;
      NonMoveable(NonMoveable&&) = delete;

      NonMoveable& operator=(NonMoveable&&) = delete;
  };

} // namespace multirender
