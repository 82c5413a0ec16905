#pragma once
#include <hopper/schema/primitives.hpp>

// Schema type: transfer message.
// Native-currency transfer as signed and submitted to the ledger. The signer
// of `from` pays the fee; the signature doubles as the transaction id.
namespace hopper::schema {

template <uint16_t Version>
struct transfer_message;

template <>
struct transfer_message<1> final {
  uint16_t version{1};
  public_key_t from{};
  public_key_t to{};
  lamports_t lamports{};
  blockhash_t recent_blockhash{};
  uint64_t compute_unit_price{};
  uint32_t compute_unit_limit{};
};

using transfer_message_t = transfer_message<1>;

template <uint16_t Version>
struct signed_transfer;

template <>
struct signed_transfer<1> final {
  uint16_t version{1};
  transfer_message_t message{};
  signature_t signature{};
};

using signed_transfer_t = signed_transfer<1>;

}  // namespace hopper::schema
