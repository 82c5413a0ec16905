#include <hopper/retry/controller.hpp>

#include <algorithm>

namespace hopper::retry {

retry_controller::retry_controller(retry_policy policy,
                                   hopper::common::clock_source_t clock)
    : policy_{policy}, clock_{std::move(clock)}, started_{clock_()} {}

void retry_controller::reset() {
  failures_ = 0;
  started_ = clock_();
}

retry_decision_t retry_controller::on_failure(
    const hopper::ledger::rpc_error_t& error) {
  if (!hopper::ledger::retryable(error)) {
    return retry_decision_t{.verdict = verdict_t::terminal};
  }
  ++failures_;
  if (failures_ >= policy_.max_attempts || expired()) {
    return retry_decision_t{.verdict = verdict_t::exhausted};
  }
  return retry_decision_t{.verdict = verdict_t::retry,
                          .delay = backoff(failures_ - 1)};
}

std::chrono::milliseconds retry_controller::backoff(
    const uint32_t failures) const {
  // Past 2^20 the cap has long been reached; stop shifting before overflow.
  auto shift = std::min<uint32_t>(failures, 20);
  auto delay = policy_.base_delay * (int64_t{1} << shift);
  return std::min(delay, policy_.max_delay);
}

uint32_t retry_controller::failures() const {
  return failures_;
}

bool retry_controller::expired() const {
  return clock_() - started_ >= policy_.step_timeout;
}

const retry_policy& retry_controller::policy() const {
  return policy_;
}

}  // namespace hopper::retry
