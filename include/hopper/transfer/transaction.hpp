#pragma once
#include <hopper/schema/primitives.hpp>
#include <hopper/schema/transfer_message.hpp>
#include <hopper/vault/key_vault.hpp>

#include <optional>

namespace hopper::transfer {

struct signed_payload_t final {
  hopper::schema::signature_t signature{};
  hopper::schema::bytes_t payload;
};

/// Sign `message` with the vault's key. The signature covers the SCALE
/// encoding of the message and is the transaction id; the payload is the
/// SCALE encoding of the signed transfer. std::nullopt when the vault holds
/// no key or does not own `message.from`.
std::optional<signed_payload_t> sign_transfer(
    const hopper::vault::key_vault& signer,
    const hopper::schema::transfer_message_t& message);

/// Decode a payload and check its signature against `message.from`.
std::optional<hopper::schema::signed_transfer_t> open_transfer(
    const hopper::schema::bytes_view_t& payload);

}  // namespace hopper::transfer
