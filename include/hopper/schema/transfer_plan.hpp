#pragma once
#include <hopper/schema/error_code.hpp>
#include <hopper/schema/primitives.hpp>
#include <hopper/schema/transfer_state.hpp>
#include <optional>

// Schema type: transfer plan.
// Durable record of one relay through one hop account.
namespace hopper::schema {

struct transfer_terms_t final {
  public_key_t sender{};
  public_key_t recipient{};
  public_key_t hop{};
  lamports_t amount{};
};

/// Fees fixed when the plan leaves INIT. Every transfer of the plan is
/// signed with this priority fee, so the cushion keeps covering them when a
/// later run is configured differently.
struct fee_quote_t final {
  lamports_t fee_per_transaction{};
  uint32_t hop_paid_transactions{2};
  lamports_t cushion{};
  uint64_t compute_unit_price{};
  uint32_t compute_unit_limit{};
};

/// Last confirmed transaction id per step.
struct step_receipts_t final {
  std::optional<signature_t> fund;
  std::optional<signature_t> forward;
  std::optional<signature_t> recover;
};

template <uint16_t Version>
struct transfer_plan;

template <>
struct transfer_plan<1> final {
  uint16_t version{1};
  hash32_t plan_id{};
  uint32_t sequence{};
  transfer_terms_t terms{};
  fee_quote_t fees{};
  transfer_state_t state{transfer_state_t::init};
  step_receipts_t receipts{};
  lamports_t recovered{};
  uint32_t next_attempt{};
  bool stuck{false};
  failure_t last_error{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using transfer_plan_t = transfer_plan<1>;

}  // namespace hopper::schema
