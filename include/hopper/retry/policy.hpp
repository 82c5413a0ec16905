#pragma once
#include <chrono>
#include <cstdint>

namespace hopper::retry {

/// Budget for one logical step. Only retryable failures count against
/// `max_attempts`; `step_timeout` bounds the step's wall time regardless.
struct retry_policy final {
  uint32_t max_attempts{5};
  std::chrono::milliseconds base_delay{500};
  std::chrono::milliseconds max_delay{16000};
  // How long one submitted attempt is awaited before the ledger is
  // re-queried about it.
  std::chrono::milliseconds confirmation_timeout{60000};
  std::chrono::milliseconds step_timeout{300000};
  // Longest single wait on the ledger; the orchestrator yields at this
  // granularity.
  std::chrono::milliseconds poll_interval{1000};
};

}  // namespace hopper::retry
