#pragma once
#include <hopper/schema/primitives.hpp>
#include <hopper/schema/transfer_plan.hpp>

#include <cstdint>
#include <optional>

namespace hopper::transfer {

inline constexpr uint64_t kMicroLamportsPerLamport = 1'000'000;
inline constexpr uint32_t kBasisPointsDenominator = 10'000;

struct fee_options final {
  // Skips the network query when set.
  std::optional<hopper::schema::lamports_t> fee_per_signature;
  uint32_t margin_bps{0};
  // Priority fee: micro-lamports per compute unit.
  uint64_t compute_unit_price{0};
  uint32_t compute_unit_limit{0};
};

/// Sizes the cushion the hop account is funded with on top of the amount.
///
/// The hop pays the forward and the recovery fee, so the cushion is at least
/// twice the per-transaction fee. Every rounding goes up: a cushion that is
/// too large is recovered, one that is too small strands the forward.
class fee_estimator final {
 public:
  explicit fee_estimator(fee_options options = {});

  /// Fee for one single-signature transfer: base fee plus
  /// ceil(compute_unit_price * compute_unit_limit / 1e6).
  hopper::schema::lamports_t transaction_fee(
      hopper::schema::lamports_t fee_per_signature) const;

  hopper::schema::lamports_t cushion(
      hopper::schema::lamports_t fee_per_transaction,
      uint32_t hop_paid_transactions = 2) const;

  hopper::schema::fee_quote_t quote(
      hopper::schema::lamports_t fee_per_signature) const;

  const fee_options& options() const;

 private:
  fee_options options_;
};

}  // namespace hopper::transfer
