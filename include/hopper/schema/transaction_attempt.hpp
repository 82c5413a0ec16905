#pragma once
#include <hopper/schema/confirmation_status.hpp>
#include <hopper/schema/error_code.hpp>
#include <hopper/schema/primitives.hpp>
#include <hopper/schema/transfer_step.hpp>

// Schema type: transaction attempt.
// One submission of one step. Written before it is sent (the signature is
// the transaction id, so it is known up front) and resolved in place to
// confirmed or failed; a retry is a new attempt with the next sequence.
namespace hopper::schema {

template <uint16_t Version>
struct transaction_attempt;

template <>
struct transaction_attempt<1> final {
  uint16_t version{1};
  hash32_t plan_id{};
  uint32_t sequence{};
  transfer_step_t step{transfer_step_t::fund};
  uint32_t attempt{};
  signature_t signature{};
  blockhash_t recent_blockhash{};
  lamports_t lamports{};
  confirmation_status_t status{confirmation_status_t::pending};
  // Set once the node acknowledged the submission. A pending attempt is
  // treated as possibly landed whatever this says.
  bool submitted{false};
  failure_t error{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using transaction_attempt_t = transaction_attempt<1>;

}  // namespace hopper::schema
