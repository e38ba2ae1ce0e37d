#include <gtest/gtest.h>
#include <oracle/execution/transaction_context.hpp>
#include <oracle/program/attestation.hpp>
#include <oracle/testing/common.hpp>

#include <optional>
#include <vector>

namespace {

using oracle::schema::error_code;
using oracle::testing::make_hash;

std::vector<oracle::schema::instruction_t> make_instructions() {
  return {
      oracle::schema::instruction_t{
          .program_id = oracle::program::kEd25519ProgramId,
          .accounts = {},
          .data = {0x00, 0x00}},
      oracle::schema::instruction_t{
          .program_id = make_hash(0x70), .accounts = {}, .data = {}}};
}

}  // namespace

TEST(transaction_context, reads_fall_through_to_base) {
  auto base = oracle::execution::account_map_t{};
  base[make_hash(1)] =
      oracle::schema::account_t{.owner = make_hash(0x70), .data = {1}};
  auto instructions = make_instructions();
  auto context = oracle::execution::transaction_context{
      [&](const oracle::schema::address_t& address)
          -> std::optional<oracle::schema::account_t> {
        if (auto it = base.find(address); it != std::end(base)) {
          return it->second;
        }
        return std::nullopt;
      },
      instructions};
  context.begin_instruction(1);

  ASSERT_TRUE(context.load_account(make_hash(1)).has_value());
  EXPECT_FALSE(context.load_account(make_hash(2)).has_value());

  ASSERT_FALSE(context.write_account(make_hash(1), {2}).has_value());
  EXPECT_EQ(context.load_account(make_hash(1))->data,
            (oracle::schema::bytes_t{2}));
  // Base is untouched until the host merges the overlay.
  EXPECT_EQ(base[make_hash(1)].data, (oracle::schema::bytes_t{1}));
  EXPECT_EQ(context.writes().size(), 1u);
}

TEST(transaction_context, create_assigns_calling_program_as_owner) {
  auto instructions = make_instructions();
  auto context = oracle::execution::transaction_context{
      [](const oracle::schema::address_t&)
          -> std::optional<oracle::schema::account_t> { return std::nullopt; },
      instructions};
  context.begin_instruction(1);

  ASSERT_FALSE(context.create_account(make_hash(3), {9}).has_value());
  auto created = context.load_account(make_hash(3));
  ASSERT_TRUE(created.has_value());
  EXPECT_EQ(created->owner, make_hash(0x70));
  EXPECT_EQ(context.create_account(make_hash(3), {9}),
            error_code::account_already_exists);
}

TEST(transaction_context, write_requires_ownership) {
  auto instructions = make_instructions();
  auto context = oracle::execution::transaction_context{
      [](const oracle::schema::address_t&)
          -> std::optional<oracle::schema::account_t> {
        return oracle::schema::account_t{.owner = make_hash(0x99), .data = {}};
      },
      instructions};
  context.begin_instruction(1);
  EXPECT_EQ(context.write_account(make_hash(4), {1}),
            error_code::not_owned_by_program);
  EXPECT_TRUE(context.writes().empty());
}

TEST(transaction_context, companion_is_previous_instruction) {
  auto instructions = make_instructions();
  auto context = oracle::execution::transaction_context{
      [](const oracle::schema::address_t&)
          -> std::optional<oracle::schema::account_t> { return std::nullopt; },
      instructions};
  context.begin_instruction(0);
  EXPECT_EQ(context.companion_instruction(), nullptr);
  context.begin_instruction(1);
  ASSERT_NE(context.companion_instruction(), nullptr);
  EXPECT_EQ(context.companion_instruction()->program_id,
            oracle::program::kEd25519ProgramId);
  EXPECT_EQ(context.program_id(), make_hash(0x70));
}
