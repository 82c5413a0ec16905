#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace hopper::common {

using time_point_t = std::chrono::steady_clock::time_point;
using clock_source_t = std::function<time_point_t()>;
using sleeper_t = std::function<void(std::chrono::milliseconds)>;

inline clock_source_t steady_clock() {
  return [] { return std::chrono::steady_clock::now(); };
}

inline sleeper_t thread_sleeper() {
  return [](const std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
  };
}

}  // namespace hopper::common
