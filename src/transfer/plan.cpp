#include <hopper/blake3/hash.hpp>
#include <hopper/schema/key/builder.hpp>
#include <hopper/transfer/plan.hpp>
#include <spdlog/spdlog.h>

namespace hopper::transfer {

namespace {

constexpr auto kPlanIdDomain = std::string_view{"hopper-plan-v1"};

}  // namespace

hopper::schema::hash32_t make_plan_id(
    const hopper::schema::transfer_terms_t& terms,
    const uint32_t sequence) {
  auto preimage = hopper::schema::key::builder{}
                      .write(kPlanIdDomain)
                      .write(terms.hop)
                      .write(sequence)
                      .write(terms.sender)
                      .write(terms.recipient)
                      .write(terms.amount)
                      .data;
  return hopper::blake3::hash(hopper::schema::make_bytes_view(preimage));
}

bool same_terms(const hopper::schema::transfer_terms_t& lhs,
                const hopper::schema::transfer_terms_t& rhs) {
  return lhs.sender == rhs.sender && lhs.recipient == rhs.recipient &&
         lhs.hop == rhs.hop && lhs.amount == rhs.amount;
}

std::optional<resolved_plan_t> resolve_plan(
    const plan_store& store,
    const hopper::schema::transfer_terms_t& terms,
    hopper::schema::failure_t& error) {
  if (terms.amount == 0) {
    error = hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::invalid_request,
        .message = "transfer amount must be greater than zero"};
    return std::nullopt;
  }
  if (terms.hop == terms.sender || terms.hop == terms.recipient) {
    error = hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::invalid_request,
        .message = "hop account must differ from sender and recipient"};
    return std::nullopt;
  }

  auto existing = store.plans(terms.hop);
  for (const auto& plan : existing) {
    if (hopper::schema::is_terminal(plan.state)) {
      continue;
    }
    if (!same_terms(plan.terms, terms)) {
      error = hopper::schema::failure_t{
          .code = hopper::schema::error_code_t::plan_mismatch,
          .message = "hop " + hopper::schema::to_base58(terms.hop) +
                     " has unfinished plan " +
                     hopper::schema::short_id(plan.plan_id) + " in state " +
                     std::string{hopper::schema::to_string(plan.state)} +
                     " for different terms"};
      return std::nullopt;
    }
    spdlog::info("[{}] Resuming plan in state {}",
                 hopper::schema::short_id(plan.plan_id),
                 hopper::schema::to_string(plan.state));
    return resolved_plan_t{.plan = plan, .resumed = true};
  }

  auto now = hopper::schema::now_milliseconds();
  auto plan = hopper::schema::transfer_plan_t{};
  plan.sequence = static_cast<uint32_t>(existing.size());
  plan.plan_id = make_plan_id(terms, plan.sequence);
  plan.terms = terms;
  plan.created_at = now;
  plan.updated_at = now;
  store.save(plan);
  spdlog::info("[{}] New plan: {} lamports from {} to {} via hop {}",
               hopper::schema::short_id(plan.plan_id), terms.amount,
               hopper::schema::to_base58(terms.sender),
               hopper::schema::to_base58(terms.recipient),
               hopper::schema::to_base58(terms.hop));
  return resolved_plan_t{.plan = plan};
}

}  // namespace hopper::transfer
