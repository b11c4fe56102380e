#pragma once

#include <cstddef>
#include <functional>

namespace multirender {

template<typename T>
void hash_combine(std::size_t& seed, const T& value) {
  seed ^= std::hash<T>{}(value) + 0x9E3779B9u + (seed << 6) + (seed >> 2);
}

} // namespace multirender
