#pragma once

#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace cann::common {

// Invariant breaks inside the engine. Flushes the log before terminating.
template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format,
                           Args&&... args) {
  spdlog::critical("invariant violated: {}",
                   fmt::format(format, std::forward<Args>(args)...));
  spdlog::shutdown();
  std::terminate();
}

}  // namespace cann::common
