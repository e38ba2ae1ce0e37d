#include <gtest/gtest.h>
#include <oracle/program/attestation.hpp>
#include <oracle/testing/common.hpp>
#include <oracle/testing/harness.hpp>

#include <optional>
#include <vector>

namespace {

struct attestation_case final {
  oracle::schema::public_key_t public_key{};
  oracle::schema::bytes_t message;
  oracle::schema::bytes_t signature;
  oracle::schema::instruction_t companion;
};

attestation_case make_case() {
  auto value = attestation_case{};
  value.public_key = oracle::testing::make_hash(0x10);
  value.message = oracle::schema::bytes_t{'h', 'e', 'l', 'l', 'o'};
  value.signature = oracle::schema::bytes_t(64, 0x5A);
  value.companion = oracle::schema::instruction_t{
      .program_id = oracle::program::kEd25519ProgramId,
      .accounts = {},
      .data = oracle::program::make_attestation_data(
          value.public_key, oracle::schema::make_bytes_view(value.message),
          oracle::schema::make_bytes_view(value.signature))};
  return value;
}

oracle::schema::program_result_t verify(const attestation_case& value) {
  return oracle::program::verify_attestation(
      &value.companion, value.public_key,
      oracle::schema::make_bytes_view(value.message),
      oracle::schema::make_bytes_view(value.signature));
}

}  // namespace

TEST(attestation, companion_layout_is_fixed) {
  auto value = make_case();
  const auto& data = value.companion.data;
  ASSERT_EQ(data.size(), 112u + value.message.size());
  EXPECT_EQ(data[0], 1u);
  EXPECT_EQ(data[1], 0u);
  // signature offset, then its instruction index (0xFFFF = this one)
  EXPECT_EQ(data[2], 48u);
  EXPECT_EQ(data[3], 0u);
  EXPECT_EQ(data[4], 0xFFu);
  EXPECT_EQ(data[5], 0xFFu);
  EXPECT_EQ(data[6], 16u);
  EXPECT_EQ(data[10], 112u);
  EXPECT_EQ(data[12], value.message.size());
  EXPECT_EQ(data[16], 0x10u);
  EXPECT_EQ(data[48], 0x5Au);
  EXPECT_EQ(data[112], 'h');
}

TEST(attestation, accepts_exact_companion) {
  EXPECT_FALSE(verify(make_case()).has_value());
}

TEST(attestation, rejects_missing_companion) {
  auto value = make_case();
  auto result = oracle::program::verify_attestation(
      nullptr, value.public_key, oracle::schema::make_bytes_view(value.message),
      oracle::schema::make_bytes_view(value.signature));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, oracle::schema::error_code::invalid_signer);
}

TEST(attestation, rejects_companion_from_other_program) {
  auto value = make_case();
  value.companion.program_id = oracle::testing::make_hash(0x70);
  EXPECT_EQ(verify(value), oracle::schema::error_code::invalid_signer);
}

TEST(attestation, rejects_companion_with_accounts) {
  auto value = make_case();
  value.companion.accounts.push_back(oracle::testing::make_hash(0x01));
  EXPECT_EQ(verify(value), oracle::schema::error_code::invalid_signer);
}

TEST(attestation, rejects_any_field_mismatch) {
  {
    auto value = make_case();
    value.public_key[0] ^= 0x01;
    EXPECT_EQ(verify(value), oracle::schema::error_code::invalid_signer);
  }
  {
    auto value = make_case();
    value.signature[10] ^= 0x01;
    EXPECT_EQ(verify(value), oracle::schema::error_code::invalid_signer);
  }
  {
    auto value = make_case();
    value.message[0] ^= 0x01;
    EXPECT_EQ(verify(value), oracle::schema::error_code::invalid_signer);
  }
  {
    auto value = make_case();
    value.message.push_back('!');
    EXPECT_EQ(verify(value), oracle::schema::error_code::invalid_signer);
  }
}

TEST(attestation, rejects_header_pointing_elsewhere) {
  auto value = make_case();
  // Message instruction index 0 instead of "this instruction".
  value.companion.data[14] = 0x00;
  value.companion.data[15] = 0x00;
  EXPECT_EQ(verify(value), oracle::schema::error_code::invalid_signer);
}

TEST(attestation, rejects_wrong_signature_length) {
  auto value = make_case();
  value.signature.pop_back();
  EXPECT_EQ(verify(value), oracle::schema::error_code::invalid_signer);
}
