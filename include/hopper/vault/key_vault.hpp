#pragma once

#include <hopper/crypto/ed25519.hpp>
#include <hopper/schema/error_code.hpp>
#include <hopper/schema/hop_account.hpp>
#include <hopper/schema/primitives.hpp>

#include <filesystem>
#include <optional>

namespace hopper::vault {

struct vault_options final {
  std::filesystem::path path;
  // False for keys the operator must provide (the sender).
  bool create_if_missing{true};
};

/// Owner of one ed25519 key file.
///
/// The file holds two lines, `PUBKEY=<base58>` and `PRIVKEY=<base58 of the
/// 64-byte secret||public pair>`, and is kept at mode 0600. The secret never
/// leaves the vault: callers receive the public identity and ask the vault
/// to sign.
class key_vault final {
 public:
  explicit key_vault(vault_options options);

  key_vault(const key_vault&) = delete;
  key_vault& operator=(const key_vault&) = delete;
  key_vault(key_vault&&) noexcept = default;
  key_vault& operator=(key_vault&&) noexcept = default;

  /// Load the key at the configured path, generating and persisting a fresh
  /// key first when the file is absent and creation is allowed.
  ///
  /// Fails with `key_corrupted` when the file exists but does not decode to
  /// a consistent keypair, and with `key_unavailable` on I/O failure or when
  /// the file is absent and creation is not allowed. Repeated calls, from
  /// this or any other vault on the same path, yield the same identity.
  std::optional<hopper::schema::hop_account_t> load_or_create(
      hopper::schema::failure_t& error);

  bool loaded() const;

  /// Identity of the loaded key. Only valid once `load_or_create` succeeded.
  const hopper::schema::hop_account_t& account() const;

  std::optional<hopper::schema::signature_t> sign(
      const hopper::schema::bytes_view_t& message) const;

  const std::filesystem::path& path() const;

 private:
  std::optional<hopper::crypto::signing_key> load(
      hopper::schema::failure_t& error) const;
  std::optional<hopper::crypto::signing_key> create(
      hopper::schema::failure_t& error) const;

  vault_options options_;
  std::optional<hopper::crypto::signing_key> key_;
  hopper::schema::hop_account_t account_;
};

}  // namespace hopper::vault
