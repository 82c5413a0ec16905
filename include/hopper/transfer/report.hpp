#pragma once
#include <hopper/schema/transaction_attempt.hpp>
#include <hopper/schema/transfer_plan.hpp>
#include <hopper/schema/transfer_step.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace hopper::transfer {

inline constexpr int kExitRecovered = 0;
inline constexpr int kExitFailed = 1;
inline constexpr int kExitStuck = 2;
inline constexpr int kExitUsage = 3;

struct step_timing_t final {
  hopper::schema::transfer_step_t step{hopper::schema::transfer_step_t::fund};
  std::chrono::milliseconds elapsed{};
};

struct transfer_report_t final {
  hopper::schema::transfer_plan_t plan;
  // Steps confirmed during this run only.
  std::vector<step_timing_t> timings;
};

/// 0 for RECOVERED, 1 for FAILED, 2 for anything still resumable.
int exit_code(const hopper::schema::transfer_plan_t& plan);

std::string format_report(const transfer_report_t& report);

/// Plan summary followed by one line per attempt, for `hopper status`.
std::string format_status(
    const hopper::schema::transfer_plan_t& plan,
    const std::vector<hopper::schema::transaction_attempt_t>& attempts);

}  // namespace hopper::transfer
