#include <hopper/crypto/ed25519.hpp>
#include <hopper/schema/encoding/scale/encoder.hpp>
#include <hopper/transfer/transaction.hpp>

namespace hopper::transfer {

std::optional<signed_payload_t> sign_transfer(
    const hopper::vault::key_vault& signer,
    const hopper::schema::transfer_message_t& message) {
  if (!signer.loaded() || signer.account().address != message.from) {
    return std::nullopt;
  }
  auto encoder = hopper::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(message);
  auto signature = signer.sign(hopper::schema::make_bytes_view(encoded));
  if (!signature) {
    return std::nullopt;
  }
  auto signed_transfer = hopper::schema::signed_transfer_t{
      .message = message, .signature = *signature};
  return signed_payload_t{.signature = *signature,
                          .payload = encoder.encode(signed_transfer)};
}

std::optional<hopper::schema::signed_transfer_t> open_transfer(
    const hopper::schema::bytes_view_t& payload) {
  auto encoder = hopper::schema::encoding::scale_encoder_t{};
  auto decoded =
      encoder.try_decode<hopper::schema::signed_transfer_t>(payload);
  if (!decoded) {
    return std::nullopt;
  }
  auto encoded = encoder.encode(decoded->message);
  if (!hopper::crypto::verify(hopper::schema::make_bytes_view(encoded),
                              decoded->message.from, decoded->signature)) {
    return std::nullopt;
  }
  return decoded;
}

}  // namespace hopper::transfer
