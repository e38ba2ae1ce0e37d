#pragma once
#include <oracle/schema/account.hpp>
#include <oracle/schema/error_code.hpp>
#include <oracle/schema/instruction.hpp>
#include <oracle/schema/primitives.hpp>

#include <optional>

namespace oracle::program {

/// What the host lends a program for one instruction: its own id, account
/// reads and writes inside the current atomic unit, and a view of the
/// instruction executed just before it.
class invocation_context {
 public:
  virtual ~invocation_context() = default;

  virtual const oracle::schema::program_id_t& program_id() const = 0;

  /// Account at `address` as seen by this invocation, or std::nullopt.
  virtual std::optional<oracle::schema::account_t> load_account(
      const oracle::schema::address_t& address) const = 0;

  /// Create an account owned by the calling program.
  /// Fails with account_already_exists.
  virtual oracle::schema::program_result_t create_account(
      const oracle::schema::address_t& address,
      oracle::schema::bytes_t data) = 0;

  /// Overwrite the data of an account owned by the calling program.
  /// Fails with not_owned_by_program.
  virtual oracle::schema::program_result_t write_account(
      const oracle::schema::address_t& address,
      oracle::schema::bytes_t data) = 0;

  /// Instruction immediately preceding the current one, or nullptr.
  virtual const oracle::schema::instruction_t* companion_instruction()
      const = 0;
};

}  // namespace oracle::program
