#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace peggy::common {

/// Log an unrecoverable invariant violation and terminate the process.
///
/// Bridge state is only ever written through a committed block, so a
/// process that stops here restarts from the last commit.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// Formatting variant; the detail is logged at error level first.
template <typename... Args>
[[noreturn]] void critical(const std::string_view message,
                           spdlog::format_string_t<Args...> detail,
                           Args&&... args) {
  spdlog::error(detail, std::forward<Args>(args)...);
  critical(message);
}

}  // namespace peggy::common
