#pragma once
#include <hopper/schema/encoding/scale/encoder.hpp>
#include <hopper/schema/transaction_attempt.hpp>
#include <hopper/schema/transfer_plan.hpp>
#include <hopper/storage/rocksdb/storage.hpp>

#include <optional>
#include <vector>

namespace hopper::transfer {

/// Durable plan and attempt records.
///
/// Every write is synchronous. A plan change caused by an attempt is written
/// in the same batch as the attempt, so a crash never leaves one without the
/// other.
class plan_store final {
 public:
  explicit plan_store(hopper::storage::rocksdb_storage_t& storage);

  std::optional<hopper::schema::transfer_plan_t> load(
      const hopper::schema::public_key_t& hop,
      uint32_t sequence) const;

  /// All plans recorded for a hop, oldest first.
  std::vector<hopper::schema::transfer_plan_t> plans(
      const hopper::schema::public_key_t& hop) const;

  /// The hop's non-terminal plan, if any.
  std::optional<hopper::schema::transfer_plan_t> active_plan(
      const hopper::schema::public_key_t& hop) const;

  void save(const hopper::schema::transfer_plan_t& plan) const;
  void save(const hopper::schema::transfer_plan_t& plan,
            const hopper::schema::transaction_attempt_t& attempt) const;

  /// Attempts of a plan in submission order.
  std::vector<hopper::schema::transaction_attempt_t> attempts(
      const hopper::schema::hash32_t& plan_id) const;

 private:
  hopper::storage::rocksdb_storage_t& storage_;
  mutable hopper::schema::encoding::scale_encoder_t encoder_;
};

}  // namespace hopper::transfer
