#include <hopper/schema/key/plan_keys.hpp>
#include <hopper/transfer/plan_store.hpp>

namespace hopper::transfer {

plan_store::plan_store(hopper::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

std::optional<hopper::schema::transfer_plan_t> plan_store::load(
    const hopper::schema::public_key_t& hop,
    const uint32_t sequence) const {
  auto key = hopper::schema::key::make_plan_key(hop, sequence);
  return storage_.get<hopper::schema::transfer_plan_t>(
      encoder_, hopper::schema::make_bytes_view(key));
}

std::vector<hopper::schema::transfer_plan_t> plan_store::plans(
    const hopper::schema::public_key_t& hop) const {
  auto prefix = hopper::schema::key::make_plan_prefix(hop);
  auto entries =
      storage_.list_by_prefix(hopper::schema::make_bytes_view(prefix));
  auto out = std::vector<hopper::schema::transfer_plan_t>{};
  out.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    out.push_back(encoder_.decode<hopper::schema::transfer_plan_t>(
        hopper::schema::make_bytes_view(value)));
  }
  return out;
}

std::optional<hopper::schema::transfer_plan_t> plan_store::active_plan(
    const hopper::schema::public_key_t& hop) const {
  for (auto& plan : plans(hop)) {
    if (!hopper::schema::is_terminal(plan.state)) {
      return plan;
    }
  }
  return std::nullopt;
}

void plan_store::save(const hopper::schema::transfer_plan_t& plan) const {
  auto key = hopper::schema::key::make_plan_key(plan.terms.hop, plan.sequence);
  storage_.put(encoder_, hopper::schema::make_bytes_view(key), plan);
}

void plan_store::save(
    const hopper::schema::transfer_plan_t& plan,
    const hopper::schema::transaction_attempt_t& attempt) const {
  storage_.write_batch(
      {{hopper::schema::key::make_plan_key(plan.terms.hop, plan.sequence),
        encoder_.encode(plan)},
       {hopper::schema::key::make_attempt_key(attempt.plan_id,
                                              attempt.sequence),
        encoder_.encode(attempt)}});
}

std::vector<hopper::schema::transaction_attempt_t> plan_store::attempts(
    const hopper::schema::hash32_t& plan_id) const {
  auto prefix = hopper::schema::key::make_attempt_prefix(plan_id);
  auto entries =
      storage_.list_by_prefix(hopper::schema::make_bytes_view(prefix));
  auto out = std::vector<hopper::schema::transaction_attempt_t>{};
  out.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    out.push_back(encoder_.decode<hopper::schema::transaction_attempt_t>(
        hopper::schema::make_bytes_view(value)));
  }
  return out;
}

}  // namespace hopper::transfer
