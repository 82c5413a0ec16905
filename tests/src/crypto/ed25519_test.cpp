#include <gtest/gtest.h>
#include <hopper/crypto/ed25519.hpp>

#include <array>
#include <string_view>

namespace {

hopper::schema::bytes_t message() {
  return hopper::schema::make_bytes(std::string_view{"relay 1000000 lamports"});
}

}  // namespace

TEST(crypto_ed25519, signs_and_verifies) {
  if (!hopper::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose Ed25519";
  }
  auto key = hopper::crypto::signing_key::generate();
  ASSERT_TRUE(key.has_value());
  auto payload = message();
  auto signature = key->sign(payload);
  ASSERT_TRUE(signature.has_value());
  EXPECT_TRUE(hopper::crypto::verify(payload, key->public_key(), *signature));

  payload.back() ^= 0x01;
  EXPECT_FALSE(hopper::crypto::verify(payload, key->public_key(), *signature));
}

TEST(crypto_ed25519, signatures_are_deterministic) {
  if (!hopper::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose Ed25519";
  }
  auto seed = hopper::schema::bytes_t(hopper::crypto::kSeedSize, 0x07);
  auto key = hopper::crypto::signing_key::from_seed(seed);
  ASSERT_TRUE(key.has_value());
  auto first = key->sign(message());
  auto second = key->sign(message());
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, *second);
}

TEST(crypto_ed25519, keypair_export_rebuilds_the_same_key) {
  if (!hopper::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose Ed25519";
  }
  auto key = hopper::crypto::signing_key::generate();
  ASSERT_TRUE(key.has_value());
  auto keypair = std::array<uint8_t, hopper::crypto::kKeypairSize>{};
  ASSERT_TRUE(key->export_keypair(keypair));

  auto rebuilt = hopper::crypto::signing_key::from_keypair(keypair);
  ASSERT_TRUE(rebuilt.has_value());
  EXPECT_EQ(rebuilt->public_key(), key->public_key());

  // A keypair whose public half belongs to another key is refused.
  keypair[hopper::crypto::kSeedSize] ^= 0x01;
  EXPECT_FALSE(hopper::crypto::signing_key::from_keypair(keypair).has_value());
}

TEST(crypto_ed25519, rejects_wrong_seed_size) {
  auto seed = hopper::schema::bytes_t(16, 0x01);
  EXPECT_FALSE(hopper::crypto::signing_key::from_seed(seed).has_value());
}
