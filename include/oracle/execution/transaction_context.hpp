#pragma once

#include <oracle/program/invocation_context.hpp>
#include <oracle/schema/account.hpp>
#include <oracle/schema/instruction.hpp>
#include <oracle/schema/primitives.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace oracle::execution {

using account_map_t =
    std::map<oracle::schema::address_t, oracle::schema::account_t>;

using account_loader_t =
    std::function<std::optional<oracle::schema::account_t>(
        const oracle::schema::address_t&)>;

/// Private account overlay for one transaction.
///
/// Reads fall through to `base` (block pending state, then committed
/// storage); writes stay in the overlay until the engine merges them, so a
/// failing transaction leaves nothing behind.
class transaction_context final : public oracle::program::invocation_context {
 public:
  transaction_context(
      account_loader_t base,
      const std::vector<oracle::schema::instruction_t>& instructions);

  /// Make `instructions[index]` the instruction being executed.
  void begin_instruction(std::size_t index);

  const oracle::schema::program_id_t& program_id() const override;

  std::optional<oracle::schema::account_t> load_account(
      const oracle::schema::address_t& address) const override;

  oracle::schema::program_result_t create_account(
      const oracle::schema::address_t& address,
      oracle::schema::bytes_t data) override;

  oracle::schema::program_result_t write_account(
      const oracle::schema::address_t& address,
      oracle::schema::bytes_t data) override;

  const oracle::schema::instruction_t* companion_instruction() const override;

  const account_map_t& writes() const;

 private:
  account_loader_t base_;
  const std::vector<oracle::schema::instruction_t>& instructions_;
  std::size_t current_{};
  account_map_t writes_;
};

}  // namespace oracle::execution
