#include <oracle/blake3/hash.hpp>
#include <oracle/crypto/verify.hpp>
#include <oracle/testing/keys.hpp>
#include <gtest/gtest.h>

#include <array>
#include <vector>

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!oracle::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
  }
  auto keypair = oracle::testing::ed25519_keypair{0x01};
  auto message = std::vector<uint8_t>{'o', 'r', 'a', 'c', 'l', 'e'};
  auto signature = keypair.sign(oracle::schema::make_bytes_view(message));

  EXPECT_TRUE(oracle::crypto::verify_signature(
      oracle::schema::make_bytes_view(message), keypair.public_key(),
      signature));

  message[0] ^= 0x01;
  EXPECT_FALSE(oracle::crypto::verify_signature(
      oracle::schema::make_bytes_view(message), keypair.public_key(),
      signature));
}

TEST(crypto_verify, rejects_signature_from_other_key) {
  if (!oracle::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
  }
  auto signer = oracle::testing::ed25519_keypair{0x01};
  auto other = oracle::testing::ed25519_keypair{0x02};
  auto message = std::vector<uint8_t>{'a', 'b', 'c'};
  auto signature = signer.sign(oracle::schema::make_bytes_view(message));
  EXPECT_FALSE(oracle::crypto::verify_signature(
      oracle::schema::make_bytes_view(message), other.public_key(),
      signature));
}

TEST(crypto_verify, rejects_zeroed_signature) {
  auto keypair = oracle::testing::ed25519_keypair{0x03};
  auto message = std::array<uint8_t, 3>{'a', 'b', 'c'};
  auto signature = oracle::schema::ed25519_signature_t{};
  EXPECT_FALSE(oracle::crypto::verify_signature(
      oracle::schema::bytes_view_t{message.data(), message.size()},
      keypair.public_key(), signature));
}

TEST(crypto_verify, real_public_keys_are_on_curve) {
  for (uint8_t seed = 1; seed <= 8; ++seed) {
    auto keypair = oracle::testing::ed25519_keypair{seed};
    EXPECT_TRUE(oracle::crypto::is_on_curve(keypair.public_key()));
  }
}

TEST(crypto_verify, identity_point_is_on_curve) {
  // y = 1, x = 0.
  auto identity = oracle::schema::hash32_t{};
  identity[0] = 0x01;
  EXPECT_TRUE(oracle::crypto::is_on_curve(identity));
}

TEST(crypto_verify, some_digests_are_off_curve) {
  // Roughly half of all 32-byte strings do not decompress; among a handful
  // of distinct digests at least one must be off the curve.
  auto off_curve = 0;
  for (uint8_t i = 0; i < 16; ++i) {
    auto digest = oracle::blake3::hash(
        oracle::schema::bytes_view_t{&i, std::size_t{1}});
    if (!oracle::crypto::is_on_curve(digest)) {
      ++off_curve;
    }
  }
  EXPECT_GT(off_curve, 0);
}
