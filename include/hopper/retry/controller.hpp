#pragma once
#include <hopper/common/clock.hpp>
#include <hopper/ledger/types.hpp>
#include <hopper/retry/policy.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace hopper::retry {

enum class verdict_t : uint8_t { retry = 0, exhausted = 1, terminal = 2 };

struct retry_decision_t final {
  verdict_t verdict{verdict_t::retry};
  std::chrono::milliseconds delay{};
};

/// Bounded exponential backoff with a per-step deadline.
///
/// The controller only keeps score; callers decide when to wait. That keeps
/// it usable both from the blocking `run` helper and from the orchestrator,
/// which turns the returned delay into a suspension.
class retry_controller final {
 public:
  retry_controller(retry_policy policy, hopper::common::clock_source_t clock);

  /// Restart the budget and the step deadline.
  void reset();

  /// Account for one failure. Terminal errors never consume budget.
  retry_decision_t on_failure(const hopper::ledger::rpc_error_t& error);

  /// base_delay * 2^failures, capped at max_delay.
  std::chrono::milliseconds backoff(uint32_t failures) const;

  uint32_t failures() const;
  bool expired() const;
  const retry_policy& policy() const;

  /// Call `fn` until it succeeds, fails terminally or the budget runs out,
  /// sleeping between attempts. Returns the last result.
  template <typename Fn>
  std::invoke_result_t<Fn&> run(std::string_view description,
                                Fn&& fn,
                                const hopper::common::sleeper_t& sleeper);

 private:
  retry_policy policy_;
  hopper::common::clock_source_t clock_;
  hopper::common::time_point_t started_;
  uint32_t failures_{};
};

template <typename Fn>
std::invoke_result_t<Fn&> retry_controller::run(
    const std::string_view description,
    Fn&& fn,
    const hopper::common::sleeper_t& sleeper) {
  reset();
  while (true) {
    auto result = fn();
    auto* error = std::get_if<hopper::ledger::rpc_error_t>(&result);
    if (error == nullptr) {
      return result;
    }
    auto decision = on_failure(*error);
    if (decision.verdict != verdict_t::retry) {
      spdlog::error("{} failed after {} attempt(s): {} ({})", description,
                    failures_ + (decision.verdict == verdict_t::terminal),
                    error->message, hopper::ledger::to_string(error->kind));
      return result;
    }
    spdlog::warn("{} failed ({}: {}); retry {}/{} in {}ms", description,
                 hopper::ledger::to_string(error->kind), error->message,
                 failures_, policy_.max_attempts, decision.delay.count());
    sleeper(decision.delay);
  }
}

}  // namespace hopper::retry
