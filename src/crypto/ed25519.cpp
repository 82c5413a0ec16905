#include <hopper/crypto/ed25519.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>

namespace hopper::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

std::optional<hopper::schema::public_key_t> raw_public_key(EVP_PKEY* key) {
  auto public_key = hopper::schema::public_key_t{};
  auto size = public_key.size();
  if (EVP_PKEY_get_raw_public_key(key, public_key.data(), &size) != 1 ||
      size != public_key.size()) {
    return std::nullopt;
  }
  return public_key;
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519();
  return available_now;
}

signing_key::signing_key(pkey_ptr key,
                         const hopper::schema::public_key_t& public_key)
    : key_{std::move(key)}, public_key_{public_key} {}

std::optional<signing_key> signing_key::generate() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    return std::nullopt;
  }
  auto* raw_key = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &raw_key) != 1) {
    return std::nullopt;
  }
  auto key = pkey_ptr{raw_key, EVP_PKEY_free};
  auto public_key = raw_public_key(key.get());
  if (!public_key) {
    return std::nullopt;
  }
  return signing_key{std::move(key), *public_key};
}

std::optional<signing_key> signing_key::from_seed(
    const hopper::schema::bytes_view_t& seed) {
  if (seed.size() != kSeedSize) {
    return std::nullopt;
  }
  auto key = pkey_ptr{EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                   seed.data(), seed.size()),
                      EVP_PKEY_free};
  if (!key) {
    return std::nullopt;
  }
  auto public_key = raw_public_key(key.get());
  if (!public_key) {
    return std::nullopt;
  }
  return signing_key{std::move(key), *public_key};
}

std::optional<signing_key> signing_key::from_keypair(
    const hopper::schema::bytes_view_t& keypair) {
  if (keypair.size() != kKeypairSize) {
    return std::nullopt;
  }
  auto key = from_seed(keypair.first(kSeedSize));
  if (!key) {
    return std::nullopt;
  }
  auto embedded = keypair.subspan(kSeedSize);
  if (!std::ranges::equal(embedded, key->public_key())) {
    return std::nullopt;
  }
  return key;
}

const hopper::schema::public_key_t& signing_key::public_key() const {
  return public_key_;
}

std::optional<hopper::schema::signature_t> signing_key::sign(
    const hopper::schema::bytes_view_t& message) const {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || !key_) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
      1) {
    return std::nullopt;
  }
  auto signature = hopper::schema::signature_t{};
  auto size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                     message.size()) != 1 ||
      size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

bool signing_key::export_keypair(std::span<uint8_t, kKeypairSize> out) const {
  if (!key_) {
    return false;
  }
  auto size = kSeedSize;
  if (EVP_PKEY_get_raw_private_key(key_.get(), out.data(), &size) != 1 ||
      size != kSeedSize) {
    OPENSSL_cleanse(out.data(), out.size());
    return false;
  }
  std::ranges::copy(public_key_, out.begin() + kSeedSize);
  return true;
}

bool verify(const hopper::schema::bytes_view_t& message,
            const hopper::schema::public_key_t& public_key,
            const hopper::schema::signature_t& signature) {
  auto pkey = evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                                       public_key.data(),
                                                       public_key.size()),
                           EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

}  // namespace hopper::crypto
