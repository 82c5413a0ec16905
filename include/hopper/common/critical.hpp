#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace hopper::common {

/// Unrecoverable local fault (state database, encoder). Plan records are
/// committed atomically, so the next run resumes from the last write that
/// made it to disk.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace hopper::common
