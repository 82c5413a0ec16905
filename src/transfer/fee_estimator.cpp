#include <hopper/transfer/fee_estimator.hpp>

#include <limits>

namespace hopper::transfer {

namespace {

constexpr auto kMaxLamports = std::numeric_limits<uint64_t>::max();

uint64_t saturating_add(const uint64_t lhs, const uint64_t rhs) {
  return lhs > kMaxLamports - rhs ? kMaxLamports : lhs + rhs;
}

uint64_t saturating_mul(const uint64_t lhs, const uint64_t rhs) {
  if (lhs != 0 && rhs > kMaxLamports / lhs) {
    return kMaxLamports;
  }
  return lhs * rhs;
}

// ceil(value / divisor) without the overflow of value + divisor - 1.
uint64_t div_ceil(const uint64_t value, const uint64_t divisor) {
  return value / divisor + (value % divisor != 0 ? 1 : 0);
}

}  // namespace

fee_estimator::fee_estimator(fee_options options)
    : options_{std::move(options)} {}

hopper::schema::lamports_t fee_estimator::transaction_fee(
    const hopper::schema::lamports_t fee_per_signature) const {
  auto priority = div_ceil(
      saturating_mul(options_.compute_unit_price, options_.compute_unit_limit),
      kMicroLamportsPerLamport);
  return saturating_add(fee_per_signature, priority);
}

hopper::schema::lamports_t fee_estimator::cushion(
    const hopper::schema::lamports_t fee_per_transaction,
    const uint32_t hop_paid_transactions) const {
  auto floor = saturating_mul(fee_per_transaction, hop_paid_transactions);
  auto scaled = div_ceil(
      saturating_mul(floor, uint64_t{kBasisPointsDenominator} + options_.margin_bps),
      kBasisPointsDenominator);
  // Saturation in the product can only lower `scaled`; never go under floor.
  return scaled < floor ? floor : scaled;
}

hopper::schema::fee_quote_t fee_estimator::quote(
    const hopper::schema::lamports_t fee_per_signature) const {
  auto fee = transaction_fee(fee_per_signature);
  auto quote = hopper::schema::fee_quote_t{};
  quote.fee_per_transaction = fee;
  quote.cushion = cushion(fee, quote.hop_paid_transactions);
  quote.compute_unit_price = options_.compute_unit_price;
  quote.compute_unit_limit = options_.compute_unit_limit;
  return quote;
}

const fee_options& fee_estimator::options() const {
  return options_;
}

}  // namespace hopper::transfer
