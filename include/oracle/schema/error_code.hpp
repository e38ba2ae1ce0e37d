#pragma once

#include <oracle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace oracle::schema {

/// Every way an invocation can fail. Values are part of the external
/// interface (returned as the transaction result code) and must stay stable.
enum class error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  malformed_instruction = 3,
  unknown_program = 4,
  not_enough_account_keys = 5,
  signature_verification_failed = 6,
  account_already_exists = 7,
  invalid_seeds = 8,
  address_mismatch = 9,
  incorrect_committee_pda = 10,
  incorrect_asset_pda = 11,
  not_owned_by_program = 12,
  incorrect_committee_id = 13,
  duplicate_request = 14,
  request_not_initialized = 15,
  invalid_signer = 16,
  malformed_record = 17,
  incorrect_request_counter = 18,
  committee_not_initialized = 19,
};

/// Success is std::nullopt.
using program_result_t = std::optional<error_code>;

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"invalid_transaction",
                                            error_code::invalid_transaction},
    std::pair<std::string_view, error_code>{
        "unsupported_transaction_version",
        error_code::unsupported_transaction_version},
    std::pair<std::string_view, error_code>{"malformed_instruction",
                                            error_code::malformed_instruction},
    std::pair<std::string_view, error_code>{"unknown_program",
                                            error_code::unknown_program},
    std::pair<std::string_view, error_code>{
        "not_enough_account_keys", error_code::not_enough_account_keys},
    std::pair<std::string_view, error_code>{
        "signature_verification_failed",
        error_code::signature_verification_failed},
    std::pair<std::string_view, error_code>{"account_already_exists",
                                            error_code::account_already_exists},
    std::pair<std::string_view, error_code>{"invalid_seeds",
                                            error_code::invalid_seeds},
    std::pair<std::string_view, error_code>{"address_mismatch",
                                            error_code::address_mismatch},
    std::pair<std::string_view, error_code>{
        "incorrect_committee_pda", error_code::incorrect_committee_pda},
    std::pair<std::string_view, error_code>{"incorrect_asset_pda",
                                            error_code::incorrect_asset_pda},
    std::pair<std::string_view, error_code>{"not_owned_by_program",
                                            error_code::not_owned_by_program},
    std::pair<std::string_view, error_code>{"incorrect_committee_id",
                                            error_code::incorrect_committee_id},
    std::pair<std::string_view, error_code>{"duplicate_request",
                                            error_code::duplicate_request},
    std::pair<std::string_view, error_code>{
        "request_not_initialized", error_code::request_not_initialized},
    std::pair<std::string_view, error_code>{"invalid_signer",
                                            error_code::invalid_signer},
    std::pair<std::string_view, error_code>{"malformed_record",
                                            error_code::malformed_record},
    std::pair<std::string_view, error_code>{
        "incorrect_request_counter", error_code::incorrect_request_counter},
    std::pair<std::string_view, error_code>{
        "committee_not_initialized", error_code::committee_not_initialized},
};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

/// Human readable diagnostic for logs and result envelopes.
inline constexpr std::string_view describe(const error_code value) {
  switch (value) {
    case error_code::invalid_transaction:
      return "Transaction bytes could not be decoded";
    case error_code::unsupported_transaction_version:
      return "Unsupported transaction version";
    case error_code::malformed_instruction:
      return "Instruction data could not be decoded";
    case error_code::unknown_program:
      return "Instruction addressed to an unknown program";
    case error_code::not_enough_account_keys:
      return "Instruction is missing required accounts";
    case error_code::signature_verification_failed:
      return "Ed25519 signature verification failed";
    case error_code::account_already_exists:
      return "Account already exists";
    case error_code::invalid_seeds:
      return "Seeds do not produce a valid program address";
    case error_code::address_mismatch:
      return "Supplied address does not match the derived address";
    case error_code::incorrect_committee_pda:
      return "Incorrect committee PDA";
    case error_code::incorrect_asset_pda:
      return "Incorrect Brc20 asset PDA";
    case error_code::not_owned_by_program:
      return "Not owned by this Brc20 Oracle program";
    case error_code::incorrect_committee_id:
      return "Committee id is not the next in sequence";
    case error_code::duplicate_request:
      return "Duplicate request for this data";
    case error_code::request_not_initialized:
      return "Brc20 request not initialized";
    case error_code::invalid_signer:
      return "Attestation was not signed by the committee";
    case error_code::malformed_record:
      return "Stored record could not be decoded";
    case error_code::incorrect_request_counter:
      return "Committee request counter cannot move backwards";
    case error_code::committee_not_initialized:
      return "Committee has not been initialized";
  }
  return "Unknown error";
}

}  // namespace oracle::schema
