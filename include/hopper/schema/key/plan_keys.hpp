#pragma once

#include <hopper/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema key type: plan keys.
// Key prefixes and codecs for plan and attempt records. Plans are grouped by
// hop account, attempts by plan; both are ordered by sequence.
namespace hopper::schema::key {

inline constexpr std::string_view kPlanKeyPrefix{"HOP|PLAN|"};
inline constexpr std::string_view kAttemptKeyPrefix{"HOP|ATTEMPT|"};

hopper::schema::bytes_t make_plan_prefix(
    const hopper::schema::public_key_t& hop);
hopper::schema::bytes_t make_plan_key(const hopper::schema::public_key_t& hop,
                                      uint32_t sequence);

hopper::schema::bytes_t make_attempt_prefix(
    const hopper::schema::hash32_t& plan_id);
hopper::schema::bytes_t make_attempt_key(
    const hopper::schema::hash32_t& plan_id,
    uint32_t sequence);

}  // namespace hopper::schema::key
