#pragma once
#include <hopper/common/clock.hpp>
#include <hopper/transfer/orchestrator.hpp>
#include <hopper/transfer/report.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <queue>
#include <vector>

namespace hopper::transfer {

/// Single-threaded run loop over independent plans.
///
/// Plans share no state, so the only coordination is ordering: the plan
/// whose suspension ends first is stepped next, and the loop sleeps only
/// when every plan is suspended.
template <typename Library>
class scheduler final {
 public:
  scheduler(hopper::common::clock_source_t clock,
            hopper::common::sleeper_t sleeper);

  /// The orchestrator must outlive `run`.
  void add(orchestrator<Library>& plan);

  /// Run every added plan to a resting point. Reports are in `add` order.
  std::vector<transfer_report_t> run();

 private:
  struct entry final {
    hopper::common::time_point_t resume_at;
    uint64_t ticket{};
    std::size_t index{};
    orchestrator<Library>* plan{nullptr};
  };

  struct later final {
    bool operator()(const entry& lhs, const entry& rhs) const {
      if (lhs.resume_at != rhs.resume_at) {
        return lhs.resume_at > rhs.resume_at;
      }
      return lhs.ticket > rhs.ticket;
    }
  };

  hopper::common::clock_source_t clock_;
  hopper::common::sleeper_t sleeper_;
  std::priority_queue<entry, std::vector<entry>, later> queue_;
  std::size_t added_{};
  uint64_t tickets_{};
};

template <typename Library>
scheduler<Library>::scheduler(hopper::common::clock_source_t clock,
                              hopper::common::sleeper_t sleeper)
    : clock_{std::move(clock)}, sleeper_{std::move(sleeper)} {}

template <typename Library>
void scheduler<Library>::add(orchestrator<Library>& plan) {
  queue_.push(entry{.resume_at = clock_(),
                    .ticket = tickets_++,
                    .index = added_++,
                    .plan = &plan});
}

template <typename Library>
std::vector<transfer_report_t> scheduler<Library>::run() {
  auto reports = std::vector<std::optional<transfer_report_t>>(added_);
  while (!queue_.empty()) {
    auto next = queue_.top();
    queue_.pop();

    auto now = clock_();
    if (next.resume_at > now) {
      sleeper_(std::chrono::ceil<std::chrono::milliseconds>(next.resume_at -
                                                             now));
    }

    auto result = next.plan->step();
    if (result.done) {
      reports[next.index] = next.plan->report();
      continue;
    }
    next.resume_at = clock_() + result.suspend;
    next.ticket = tickets_++;
    queue_.push(next);
  }

  auto out = std::vector<transfer_report_t>{};
  out.reserve(reports.size());
  for (auto& report : reports) {
    if (report) {
      out.push_back(std::move(*report));
    }
  }
  added_ = 0;
  return out;
}

}  // namespace hopper::transfer
