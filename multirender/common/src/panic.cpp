#include <multirender/panic.hpp>
#include <cstdlib>
#include <fmt/color.h>

namespace multirender {

  void default_panic_handler(const char* file, int line, const char* message) {
    fmt::print(stderr, fmt::fg(fmt::color::red), "panic: {}:{}: {}\n", file, line, message);
  }

  static PanicHandlerFn g_panic_handler_fn = &default_panic_handler;

  namespace detail {

    [[noreturn]] void call_panic_handler(const char* file, int line, const char* message) {
      g_panic_handler_fn(file, line, message);
      std::exit(-1);
    }

  } // namespace multirender::detail

  void set_panic_handler(PanicHandlerFn handler) {
    g_panic_handler_fn = handler ? handler : &default_panic_handler;
  }

} // namespace multirender
