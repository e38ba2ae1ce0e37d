#pragma once
#include <oracle/program/invocation_context.hpp>
#include <oracle/program/uid_policy.hpp>
#include <oracle/schema/encoding/scale/encoder.hpp>
#include <oracle/schema/error_code.hpp>
#include <oracle/schema/instruction.hpp>
#include <oracle/schema/oracle_instruction.hpp>

namespace oracle::program {

/// The oracle program: committee succession and asset record lifecycle.
///
/// Every entry point reads what it needs through the invocation context,
/// checks addresses, ownership, sequencing and attestation, then writes a
/// single record. Any returned error makes the host discard all writes of
/// the transaction.
class processor final {
 public:
  explicit processor(oracle::schema::encoding::encoder<
                         oracle::schema::encoding::scale_encoder_tag>& encoder,
                     uid_policy policy = uid_policy::assign_and_increment);

  /// Decode `instruction.data` and dispatch to the matching entry point.
  oracle::schema::program_result_t process_instruction(
      invocation_context& context,
      const oracle::schema::instruction_t& instruction);

  /// Accounts: [committee].
  oracle::schema::program_result_t set_committee(
      invocation_context& context,
      const oracle::schema::instruction_t& instruction,
      const oracle::schema::set_committee_t& request);

  /// Accounts: [committee, asset].
  oracle::schema::program_result_t request_asset(
      invocation_context& context,
      const oracle::schema::instruction_t& instruction,
      const oracle::schema::request_asset_t& request);

  /// Accounts: [committee, asset].
  oracle::schema::program_result_t insert_asset(
      invocation_context& context,
      const oracle::schema::instruction_t& instruction,
      const oracle::schema::insert_asset_t& request);

  uid_policy policy() const;

 private:
  oracle::schema::encoding::encoder<
      oracle::schema::encoding::scale_encoder_tag>& encoder_;
  uid_policy policy_{uid_policy::assign_and_increment};
};

}  // namespace oracle::program
