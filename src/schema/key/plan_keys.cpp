#include <hopper/schema/key/builder.hpp>
#include <hopper/schema/key/plan_keys.hpp>

namespace hopper::schema::key {

hopper::schema::bytes_t make_plan_prefix(
    const hopper::schema::public_key_t& hop) {
  return builder{}.write(kPlanKeyPrefix).write(hop).data;
}

hopper::schema::bytes_t make_plan_key(const hopper::schema::public_key_t& hop,
                                      const uint32_t sequence) {
  return builder{}.write(kPlanKeyPrefix).write(hop).write(sequence).data;
}

hopper::schema::bytes_t make_attempt_prefix(
    const hopper::schema::hash32_t& plan_id) {
  return builder{}.write(kAttemptKeyPrefix).write(plan_id).data;
}

hopper::schema::bytes_t make_attempt_key(
    const hopper::schema::hash32_t& plan_id,
    const uint32_t sequence) {
  return builder{}.write(kAttemptKeyPrefix).write(plan_id).write(sequence).data;
}

}  // namespace hopper::schema::key
