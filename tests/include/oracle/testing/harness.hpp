#pragma once

#include <oracle/address/derive.hpp>
#include <oracle/execution/transaction_context.hpp>
#include <oracle/host/ed25519_program.hpp>
#include <oracle/program/attestation.hpp>
#include <oracle/program/processor.hpp>
#include <oracle/program/uid_policy.hpp>
#include <oracle/schema/asset_record.hpp>
#include <oracle/schema/committee.hpp>
#include <oracle/schema/oracle_instruction.hpp>
#include <oracle/schema/transaction.hpp>
#include <oracle/testing/common.hpp>
#include <oracle/testing/keys.hpp>

#include <cstdint>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace oracle::testing {

inline oracle::schema::instruction_t make_companion(
    const oracle::schema::public_key_t& public_key,
    const oracle::schema::bytes_view_t& message,
    const oracle::schema::ed25519_signature_t& signature) {
  return oracle::schema::instruction_t{
      .program_id = oracle::program::kEd25519ProgramId,
      .accounts = {},
      .data = oracle::program::make_attestation_data(
          public_key, message,
          oracle::schema::bytes_view_t{signature.data(), signature.size()})};
}

inline oracle::schema::bytes_t encode_transaction(
    const std::vector<oracle::schema::instruction_t>& instructions) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(oracle::schema::transaction_t{
      .version = 1, .instructions = instructions});
}

/// Builds the instruction lists a relayer would submit for each oracle
/// operation, companion instructions included.
class instruction_builder final {
 public:
  instruction_builder(scale_encoder_t& encoder,
                      const oracle::schema::program_id_t& program_id)
      : encoder_{encoder}, program_id_{program_id} {}

  oracle::schema::address_t committee_address() const {
    return oracle::address::committee_address(program_id_);
  }

  oracle::schema::address_t asset_address(
      const oracle::schema::asset_key_t& key) const {
    return oracle::address::asset_address(encoder_, key, program_id_);
  }

  oracle::schema::instruction_t make_instruction(
      std::vector<oracle::schema::address_t> accounts,
      const oracle::schema::oracle_instruction_t& payload) const {
    return oracle::schema::instruction_t{.program_id = program_id_,
                                         .accounts = std::move(accounts),
                                         .data = encoder_.encode(payload)};
  }

  std::vector<oracle::schema::instruction_t> bootstrap(
      const oracle::schema::committee_t& committee) const {
    return {make_instruction(
        {committee_address()},
        oracle::schema::set_committee_t{.committee = committee,
                                        .signature = {}})};
  }

  std::vector<oracle::schema::instruction_t> rotate(
      const ed25519_keypair& current,
      const oracle::schema::committee_t& next) const {
    auto message = encoder_.encode(next);
    auto signature = current.sign(oracle::schema::make_bytes_view(message));
    return {make_companion(current.public_key(),
                           oracle::schema::make_bytes_view(message), signature),
            make_instruction(
                {committee_address()},
                oracle::schema::set_committee_t{
                    .committee = next,
                    .signature = oracle::schema::bytes_t{
                        std::begin(signature), std::end(signature)}})};
  }

  std::vector<oracle::schema::instruction_t> request(
      const oracle::schema::asset_key_t& key) const {
    return {make_instruction({committee_address(), asset_address(key)},
                             oracle::schema::request_asset_t{.key = key})};
  }

  /// Message the committee signs to attest `amount` for the record opened
  /// with `assigned_uid`.
  oracle::schema::bytes_t attested_record(
      const oracle::schema::asset_key_t& key,
      const oracle::schema::amount_t& amount,
      const uint64_t assigned_uid) const {
    auto record = oracle::schema::asset_record_t{};
    record.initialized = true;
    record.assigned_uid = assigned_uid;
    record.key = key;
    record.amount = amount;
    return encoder_.encode(record);
  }

  std::vector<oracle::schema::instruction_t> insert(
      const ed25519_keypair& signer,
      const oracle::schema::asset_key_t& key,
      const oracle::schema::amount_t& amount,
      const uint64_t assigned_uid) const {
    auto message = attested_record(key, amount, assigned_uid);
    auto signature = signer.sign(oracle::schema::make_bytes_view(message));
    return {make_companion(signer.public_key(),
                           oracle::schema::make_bytes_view(message), signature),
            make_instruction(
                {committee_address(), asset_address(key)},
                oracle::schema::insert_asset_t{
                    .key = key,
                    .amount = amount,
                    .signature = oracle::schema::bytes_t{
                        std::begin(signature), std::end(signature)}})};
  }

  const oracle::schema::program_id_t& program_id() const { return program_id_; }

 private:
  scale_encoder_t& encoder_;
  oracle::schema::program_id_t program_id_;
};

/// In-memory host: runs instruction lists through the ed25519 facility and
/// the processor with the same all-or-nothing rule as the engine, without
/// RocksDB.
class memory_ledger final {
 public:
  memory_ledger(scale_encoder_t& encoder,
                const oracle::schema::program_id_t& program_id,
                const oracle::program::uid_policy policy =
                    oracle::program::uid_policy::assign_and_increment)
      : encoder_{encoder}, program_id_{program_id}, processor_{encoder, policy} {}

  oracle::schema::program_result_t execute(
      const std::vector<oracle::schema::instruction_t>& instructions) {
    auto context = oracle::execution::transaction_context{
        [this](const oracle::schema::address_t& address)
            -> std::optional<oracle::schema::account_t> {
          return account(address);
        },
        instructions};
    for (std::size_t i = 0; i < instructions.size(); ++i) {
      context.begin_instruction(i);
      const auto& instruction = instructions[i];
      if (instruction.program_id == oracle::program::kEd25519ProgramId) {
        if (auto error =
                oracle::host::execute_ed25519_instruction(instructions, i)) {
          return error;
        }
        continue;
      }
      if (instruction.program_id != program_id_) {
        return oracle::schema::error_code::unknown_program;
      }
      if (auto error = processor_.process_instruction(context, instruction)) {
        return error;
      }
    }
    for (const auto& [address, account] : context.writes()) {
      accounts_[address] = account;
    }
    return std::nullopt;
  }

  std::optional<oracle::schema::account_t> account(
      const oracle::schema::address_t& address) const {
    if (auto it = accounts_.find(address); it != std::end(accounts_)) {
      return it->second;
    }
    return std::nullopt;
  }

  void put_account(const oracle::schema::address_t& address,
                   oracle::schema::account_t account) {
    accounts_[address] = std::move(account);
  }

  std::optional<oracle::schema::committee_t> committee() const {
    auto stored = account(oracle::address::committee_address(program_id_));
    if (!stored) {
      return std::nullopt;
    }
    return encoder_.try_decode_exact<oracle::schema::committee_t>(
        oracle::schema::make_bytes_view(stored->data));
  }

  std::optional<oracle::schema::asset_record_t> record(
      const oracle::schema::asset_key_t& key) const {
    auto stored = account(
        oracle::address::asset_address(encoder_, key, program_id_));
    if (!stored) {
      return std::nullopt;
    }
    return encoder_.try_decode_exact<oracle::schema::asset_record_t>(
        oracle::schema::make_bytes_view(stored->data));
  }

  const oracle::execution::account_map_t& accounts() const {
    return accounts_;
  }

 private:
  scale_encoder_t& encoder_;
  oracle::schema::program_id_t program_id_;
  oracle::program::processor processor_;
  oracle::execution::account_map_t accounts_;
};

}  // namespace oracle::testing
