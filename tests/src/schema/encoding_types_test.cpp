#include <gtest/gtest.h>
#include <oracle/schema/account.hpp>
#include <oracle/schema/asset_record.hpp>
#include <oracle/schema/committee.hpp>
#include <oracle/schema/encoding/scale/encoder.hpp>
#include <oracle/schema/oracle_instruction.hpp>
#include <oracle/schema/transaction.hpp>
#include <oracle/testing/common.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <limits>
#include <tuple>
#include <vector>

namespace {

using oracle::testing::make_asset_key;
using oracle::testing::make_hash;
using oracle::testing::scale_encoder_t;

oracle::schema::committee_t make_committee() {
  auto committee = oracle::schema::committee_t{};
  committee.change_id = 3;
  committee.signer_address = make_hash(0x20);
  committee.request_counter = 0x0102030405060708ull;
  return committee;
}

}  // namespace

TEST(encoding_types, committee_layout_is_fixed_width) {
  auto encoder = scale_encoder_t{};
  auto encoded = encoder.encode(make_committee());
  ASSERT_EQ(encoded.size(), 41u);
  EXPECT_EQ(encoded[0], 3u);
  EXPECT_EQ(encoded[1], 0x20u);
  // request_counter is little-endian.
  EXPECT_EQ(encoded[33], 0x08u);
  EXPECT_EQ(encoded[40], 0x01u);

  auto decoded = encoder.try_decode_exact<oracle::schema::committee_t>(
      oracle::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, make_committee());
}

TEST(encoding_types, asset_record_layout_matches_fields) {
  auto encoder = scale_encoder_t{};
  auto record = oracle::schema::asset_record_t{};
  record.initialized = true;
  record.assigned_uid = 9;
  record.key = make_asset_key(840000, "ordi");
  record.amount = oracle::schema::amount_t{0x0102};

  auto encoded = encoder.encode(record);
  // tag(5) + initialized(1) + uid(8) + key(4 + 4 + 1 + 1 + 32) + amount(16)
  ASSERT_EQ(encoded.size(), 72u);
  EXPECT_TRUE(std::equal(std::begin(oracle::schema::kAssetNamespaceTag),
                         std::end(oracle::schema::kAssetNamespaceTag),
                         std::begin(encoded)));
  EXPECT_EQ(encoded[5], 1u);
  EXPECT_EQ(encoded[6], 9u);
  // p2tr_tweaked is the fourth address variant.
  EXPECT_EQ(encoded[22], 0u);
  EXPECT_EQ(encoded[23], 3u);
  EXPECT_EQ(encoded[56], 0x02u);
  EXPECT_EQ(encoded[57], 0x01u);
  EXPECT_EQ(encoded[71], 0x00u);
}

TEST(encoding_types, amount_preserves_full_u128_range) {
  auto encoder = scale_encoder_t{};
  auto record = oracle::schema::asset_record_t{};
  record.key = make_asset_key(1, "sats");
  record.amount = std::numeric_limits<oracle::schema::amount_t>::max();

  auto encoded = encoder.encode(record);
  EXPECT_TRUE(std::all_of(std::end(encoded) - 16, std::end(encoded),
                          [](uint8_t byte) { return byte == 0xFF; }));
  auto decoded = encoder.try_decode_exact<oracle::schema::asset_record_t>(
      oracle::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->amount, record.amount);
}

TEST(encoding_types, strict_decode_rejects_trailing_bytes) {
  auto encoder = scale_encoder_t{};
  auto encoded = encoder.encode(make_committee());
  encoded.push_back(0x00);
  EXPECT_FALSE(encoder
                   .try_decode_exact<oracle::schema::committee_t>(
                       oracle::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(encoding_types, strict_decode_rejects_truncated_input) {
  auto encoder = scale_encoder_t{};
  auto encoded = encoder.encode(make_committee());
  encoded.pop_back();
  EXPECT_FALSE(encoder
                   .try_decode_exact<oracle::schema::committee_t>(
                       oracle::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(encoding_types, strict_decode_rejects_unknown_network) {
  auto encoder = scale_encoder_t{};
  auto key = make_asset_key(1, "ordi");
  auto encoded = encoder.encode(key);
  encoded[8] = 0x07;
  EXPECT_FALSE(encoder
                   .try_decode_exact<oracle::schema::asset_key_t>(
                       oracle::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(encoding_types, strict_decode_rejects_non_canonical_bool) {
  auto encoder = scale_encoder_t{};
  auto record = oracle::schema::asset_record_t{};
  record.key = make_asset_key(1, "ordi");
  auto encoded = encoder.encode(record);
  encoded[5] = 0x02;
  EXPECT_FALSE(encoder
                   .try_decode_exact<oracle::schema::asset_record_t>(
                       oracle::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(encoding_types, committee_bytes_are_not_an_asset_record) {
  auto encoder = scale_encoder_t{};
  auto encoded = encoder.encode(make_committee());
  EXPECT_FALSE(encoder
                   .try_decode_exact<oracle::schema::asset_record_t>(
                       oracle::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(encoding_types, oracle_instruction_tag_selects_entry_point) {
  auto encoder = scale_encoder_t{};
  auto set = encoder.encode(oracle::schema::oracle_instruction_t{
      oracle::schema::set_committee_t{.committee = make_committee(),
                                      .signature = {}}});
  auto request = encoder.encode(oracle::schema::oracle_instruction_t{
      oracle::schema::request_asset_t{.key = make_asset_key(1, "ordi")}});
  auto insert = encoder.encode(oracle::schema::oracle_instruction_t{
      oracle::schema::insert_asset_t{.key = make_asset_key(1, "ordi"),
                                     .amount = oracle::schema::amount_t{5},
                                     .signature = {}}});
  EXPECT_EQ(set[0], 0u);
  EXPECT_EQ(request[0], 1u);
  EXPECT_EQ(insert[0], 2u);

  auto unknown = request;
  unknown[0] = 0x03;
  EXPECT_FALSE(encoder
                   .try_decode_exact<oracle::schema::oracle_instruction_t>(
                       oracle::schema::make_bytes_view(unknown))
                   .has_value());
}

TEST(encoding_types, transaction_round_trips_instruction_list) {
  auto encoder = scale_encoder_t{};
  auto tx = oracle::schema::transaction_t{};
  tx.instructions.push_back(oracle::schema::instruction_t{
      .program_id = make_hash(0x01),
      .accounts = {make_hash(0x02), make_hash(0x03)},
      .data = {0xAA, 0xBB}});
  tx.instructions.push_back(oracle::schema::instruction_t{
      .program_id = make_hash(0x04), .accounts = {}, .data = {}});

  auto encoded = encoder.encode(tx);
  EXPECT_EQ(encoded[0], 1u);
  EXPECT_EQ(encoded[1], 0u);
  auto decoded = encoder.try_decode_exact<oracle::schema::transaction_t>(
      oracle::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  ASSERT_EQ(decoded->instructions.size(), 2u);
  EXPECT_EQ(decoded->instructions[0], tx.instructions[0]);
  EXPECT_EQ(decoded->instructions[1], tx.instructions[1]);
}

TEST(encoding_types, account_carries_owner_and_opaque_data) {
  auto encoder = scale_encoder_t{};
  auto account = oracle::schema::account_t{.owner = make_hash(0x09),
                                           .data = {1, 2, 3}};
  auto encoded = encoder.encode(account);
  // owner(32) + compact length(1) + data(3)
  ASSERT_EQ(encoded.size(), 36u);
  EXPECT_EQ(encoded[32], 3u << 2);
  auto decoded = encoder.try_decode_exact<oracle::schema::account_t>(
      oracle::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, account);
}

TEST(encoding_types, tuple_encoding_is_field_concatenation) {
  auto encoder = scale_encoder_t{};
  auto height = int64_t{7};
  auto root = make_hash(0x33);
  auto encoded = encoder.encode(std::tuple{height, root});
  ASSERT_EQ(encoded.size(), 40u);
  EXPECT_EQ(encoded[0], 7u);
  EXPECT_EQ(encoded[8], 0x33u);
}
