#include <hopper/transfer/report.hpp>
#include <spdlog/fmt/fmt.h>

#include <iterator>
#include <optional>

namespace hopper::transfer {

namespace {

void append_receipt(std::string& out,
                    const std::string_view label,
                    const std::optional<hopper::schema::signature_t>& receipt) {
  fmt::format_to(std::back_inserter(out), "  {:<8} {}\n", label,
                 receipt ? hopper::schema::to_base58(*receipt)
                         : std::string{"-"});
}

void append_plan(std::string& out, const hopper::schema::transfer_plan_t& plan) {
  auto inserter = std::back_inserter(out);
  fmt::format_to(inserter, "plan      {}\n",
                 hopper::schema::to_hex(plan.plan_id));
  fmt::format_to(inserter, "state     {}{}\n",
                 hopper::schema::to_string(plan.state),
                 plan.stuck ? " (stuck, resumable)" : "");
  fmt::format_to(inserter, "sender    {}\n",
                 hopper::schema::to_base58(plan.terms.sender));
  fmt::format_to(inserter, "recipient {}\n",
                 hopper::schema::to_base58(plan.terms.recipient));
  fmt::format_to(inserter, "hop       {}\n",
                 hopper::schema::to_base58(plan.terms.hop));
  fmt::format_to(inserter, "amount    {}\n", plan.terms.amount);
  fmt::format_to(inserter, "fee       {} per transaction, cushion {}\n",
                 plan.fees.fee_per_transaction, plan.fees.cushion);
  fmt::format_to(inserter, "recovered {}\n", plan.recovered);
  if (hopper::schema::has_failure(plan.last_error)) {
    fmt::format_to(inserter, "error     {} during {}: {}\n",
                   hopper::schema::to_string(plan.last_error.code),
                   hopper::schema::to_string(plan.last_error.step),
                   plan.last_error.message);
  }
  out.append("receipts\n");
  append_receipt(out, "fund", plan.receipts.fund);
  append_receipt(out, "forward", plan.receipts.forward);
  append_receipt(out, "recover", plan.receipts.recover);
}

}  // namespace

int exit_code(const hopper::schema::transfer_plan_t& plan) {
  switch (plan.state) {
    case hopper::schema::transfer_state_t::recovered:
      return kExitRecovered;
    case hopper::schema::transfer_state_t::failed:
      return kExitFailed;
    default:
      return kExitStuck;
  }
}

std::string format_report(const transfer_report_t& report) {
  auto out = std::string{};
  append_plan(out, report.plan);
  if (!report.timings.empty()) {
    out.append("timings\n");
    for (const auto& timing : report.timings) {
      fmt::format_to(std::back_inserter(out), "  {:<8} {}ms\n",
                     hopper::schema::to_string(timing.step),
                     timing.elapsed.count());
    }
  }
  return out;
}

std::string format_status(
    const hopper::schema::transfer_plan_t& plan,
    const std::vector<hopper::schema::transaction_attempt_t>& attempts) {
  auto out = std::string{};
  append_plan(out, plan);
  out.append("attempts\n");
  for (const auto& attempt : attempts) {
    fmt::format_to(std::back_inserter(out), "  #{:<3} {:<8} try {} {:<9} {} {}",
                   attempt.sequence, hopper::schema::to_string(attempt.step),
                   attempt.attempt, hopper::schema::to_string(attempt.status),
                   attempt.lamports, hopper::schema::to_base58(attempt.signature));
    if (hopper::schema::has_failure(attempt.error)) {
      fmt::format_to(std::back_inserter(out), " ({}: {})",
                     hopper::schema::to_string(attempt.error.code),
                     attempt.error.message);
    }
    out.push_back('\n');
  }
  return out;
}

}  // namespace hopper::transfer
