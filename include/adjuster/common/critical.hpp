#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace adjuster::common {

/// Log, flush and bring the process down. Used only for failures the registry
/// cannot recover from (the durable store is unusable or holds corrupt data).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
  requires(sizeof...(Args) > 0)
[[noreturn]] void critical(fmt::format_string<Args...> format,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Args>(args)...)});
}

}  // namespace adjuster::common
