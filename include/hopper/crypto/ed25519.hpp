#pragma once

#include <hopper/schema/primitives.hpp>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <optional>
#include <span>

namespace hopper::crypto {

inline constexpr std::size_t kSeedSize = 32;
inline constexpr std::size_t kKeypairSize = 64;

/// True when the linked OpenSSL exposes Ed25519.
bool available();

/// Ed25519 private key held inside OpenSSL. Move-only; the raw secret is
/// only ever materialized by `export_keypair` into a caller buffer.
class signing_key final {
 public:
  /// Fresh key from the OpenSSL CSPRNG.
  static std::optional<signing_key> generate();

  /// Rebuild from a 32-byte seed; std::nullopt on a wrong size.
  static std::optional<signing_key> from_seed(
      const hopper::schema::bytes_view_t& seed);

  /// Rebuild from the 64-byte secret||public encoding; std::nullopt when the
  /// embedded public half does not match the key derived from the seed.
  static std::optional<signing_key> from_keypair(
      const hopper::schema::bytes_view_t& keypair);

  signing_key(signing_key&&) noexcept = default;
  signing_key& operator=(signing_key&&) noexcept = default;
  signing_key(const signing_key&) = delete;
  signing_key& operator=(const signing_key&) = delete;
  ~signing_key() = default;

  const hopper::schema::public_key_t& public_key() const;

  std::optional<hopper::schema::signature_t> sign(
      const hopper::schema::bytes_view_t& message) const;

  /// Write secret||public into `out`. The caller owns wiping it.
  bool export_keypair(std::span<uint8_t, kKeypairSize> out) const;

 private:
  using pkey_ptr = std::unique_ptr<EVP_PKEY, void (*)(EVP_PKEY*)>;

  signing_key(pkey_ptr key, const hopper::schema::public_key_t& public_key);

  pkey_ptr key_;
  hopper::schema::public_key_t public_key_{};
};

bool verify(const hopper::schema::bytes_view_t& message,
            const hopper::schema::public_key_t& public_key,
            const hopper::schema::signature_t& signature);

}  // namespace hopper::crypto
