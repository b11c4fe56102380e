#pragma once

#include <fmt/format.h>
#include <string>
#include <utility>

namespace multirender {

namespace detail {

[[noreturn]] void call_panic_handler(const char* file, int line, const char* message);

template<typename... Args>
[[noreturn]] void panic(const char* file, int line, fmt::format_string<Args...> format, Args&&... args) {
  std::string message = fmt::format(format, std::forward<Args>(args)...);

  call_panic_handler(file, line, message.c_str());
}

} // namespace multirender::detail

typedef void (*PanicHandlerFn)(const char* file, int line, const char* message);

/**
 * Replaces the function that reports a panic. The process is terminated after the
 * handler returns, so a handler that wants to recover has to leave by throwing.
 */
void set_panic_handler(PanicHandlerFn handler);

} // namespace multirender

#define MULTIRENDER_PANIC(format, ...) multirender::detail::panic(__FILE__, __LINE__, format, ## __VA_ARGS__)

#define MULTIRENDER_UNREACHABLE() MULTIRENDER_PANIC("Reached supposedly unreachable code")
