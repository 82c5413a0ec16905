#pragma once
#include <hopper/schema/error_code.hpp>
#include <hopper/schema/transfer_plan.hpp>
#include <hopper/transfer/plan_store.hpp>

#include <cstdint>
#include <optional>

namespace hopper::transfer {

/// blake3("hopper-plan-v1" | hop | sequence | sender | recipient | amount).
hopper::schema::hash32_t make_plan_id(
    const hopper::schema::transfer_terms_t& terms,
    uint32_t sequence);

bool same_terms(const hopper::schema::transfer_terms_t& lhs,
                const hopper::schema::transfer_terms_t& rhs);

struct resolved_plan_t final {
  hopper::schema::transfer_plan_t plan;
  bool resumed{false};
};

/// Find the plan a transfer request continues, or record a new one.
///
/// A hop has at most one non-terminal plan. A request with the same terms
/// resumes it; any other request is refused with `plan_mismatch` until it
/// finishes. Terms are checked first: the amount must be positive and the
/// hop must differ from both endpoints (`invalid_request`).
std::optional<resolved_plan_t> resolve_plan(
    const plan_store& store,
    const hopper::schema::transfer_terms_t& terms,
    hopper::schema::failure_t& error);

}  // namespace hopper::transfer
