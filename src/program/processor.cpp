#include <oracle/address/derive.hpp>
#include <oracle/program/attestation.hpp>
#include <oracle/program/processor.hpp>
#include <oracle/schema/asset_record.hpp>
#include <oracle/schema/committee.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>

using namespace oracle::schema;

namespace oracle::program {

namespace {

using encoder_t = oracle::schema::encoding::encoder<
    oracle::schema::encoding::scale_encoder_tag>;

constexpr auto kCommitteeAccountIndex = std::size_t{0};
constexpr auto kAssetAccountIndex = std::size_t{1};

program_result_t fail(std::string_view entry_point, error_code code) {
  spdlog::warn("{} rejected: {} ({})", entry_point, to_string(code),
               describe(code));
  return code;
}

// Committee account resolution shared by every entry point.
struct committee_slot final {
  address_t address{};
  std::optional<account_t> account;
  std::optional<committee_t> committee;
};

std::variant<committee_slot, error_code> load_committee(
    encoder_t& encoder,
    invocation_context& context,
    const instruction_t& instruction) {
  auto slot = committee_slot{};
  slot.address = oracle::address::committee_address(context.program_id());
  if (oracle::address::verify_program_address(
          slot.address, instruction.accounts[kCommitteeAccountIndex])) {
    return error_code::incorrect_committee_pda;
  }
  slot.account = context.load_account(slot.address);
  if (slot.account && slot.account->owner != context.program_id()) {
    return error_code::not_owned_by_program;
  }
  if (slot.account) {
    slot.committee = encoder.try_decode_exact<committee_t>(
        make_bytes_view(slot.account->data));
  }
  return slot;
}

program_result_t store(invocation_context& context,
                       const address_t& address,
                       bool exists,
                       bytes_t data) {
  if (exists) {
    return context.write_account(address, std::move(data));
  }
  return context.create_account(address, std::move(data));
}

}  // namespace

processor::processor(encoder_t& encoder, uid_policy policy)
    : encoder_{encoder}, policy_{policy} {}

uid_policy processor::policy() const {
  return policy_;
}

program_result_t processor::process_instruction(
    invocation_context& context,
    const instruction_t& instruction) {
  auto payload = encoder_.try_decode_exact<oracle_instruction_t>(
      make_bytes_view(instruction.data));
  if (!payload) {
    return fail("process_instruction", error_code::malformed_instruction);
  }
  auto result = program_result_t{};
  std::visit(overloaded{[&](const set_committee_t& value) {
                          result = set_committee(context, instruction, value);
                        },
                        [&](const request_asset_t& value) {
                          result = request_asset(context, instruction, value);
                        },
                        [&](const insert_asset_t& value) {
                          result = insert_asset(context, instruction, value);
                        }},
             payload.value());
  return result;
}

program_result_t processor::set_committee(invocation_context& context,
                                          const instruction_t& instruction,
                                          const set_committee_t& request) {
  constexpr auto kEntryPoint = std::string_view{"set_committee"};
  if (instruction.accounts.size() < 1) {
    return fail(kEntryPoint, error_code::not_enough_account_keys);
  }
  auto loaded = load_committee(encoder_, context, instruction);
  if (auto* error = std::get_if<error_code>(&loaded)) {
    return fail(kEntryPoint, *error);
  }
  auto& slot = std::get<committee_slot>(loaded);
  const auto& next = request.committee;
  auto encoded_next = encoder_.encode(next);

  if (!slot.committee) {
    if (next.change_id != 0) {
      return fail(kEntryPoint, error_code::incorrect_committee_id);
    }
    if (auto error = store(context, slot.address, slot.account.has_value(),
                           std::move(encoded_next))) {
      return fail(kEntryPoint, *error);
    }
    spdlog::info("set committee: bootstrap signer {} at {}",
                 to_hex(next.signer_address), to_hex(slot.address));
    return std::nullopt;
  }

  const auto& current = slot.committee.value();
  if (static_cast<uint32_t>(next.change_id) !=
      static_cast<uint32_t>(current.change_id) + 1) {
    return fail(kEntryPoint, error_code::incorrect_committee_id);
  }
  if (next.request_counter < current.request_counter) {
    return fail(kEntryPoint, error_code::incorrect_request_counter);
  }
  if (auto error = verify_attestation(
          context.companion_instruction(), current.signer_address,
          make_bytes_view(encoded_next), make_bytes_view(request.signature))) {
    return fail(kEntryPoint, *error);
  }
  if (auto error = context.write_account(slot.address, std::move(encoded_next))) {
    return fail(kEntryPoint, *error);
  }
  spdlog::info("set committee: change_id {} signer {}", next.change_id,
               to_hex(next.signer_address));
  return std::nullopt;
}

program_result_t processor::request_asset(invocation_context& context,
                                          const instruction_t& instruction,
                                          const request_asset_t& request) {
  constexpr auto kEntryPoint = std::string_view{"request_asset"};
  if (instruction.accounts.size() < 2) {
    return fail(kEntryPoint, error_code::not_enough_account_keys);
  }
  auto loaded = load_committee(encoder_, context, instruction);
  if (auto* error = std::get_if<error_code>(&loaded)) {
    return fail(kEntryPoint, *error);
  }
  auto& slot = std::get<committee_slot>(loaded);

  auto asset_address = oracle::address::asset_address(encoder_, request.key,
                                                      context.program_id());
  if (oracle::address::verify_program_address(
          asset_address, instruction.accounts[kAssetAccountIndex])) {
    return fail(kEntryPoint, error_code::incorrect_asset_pda);
  }
  auto existing = context.load_account(asset_address);
  if (existing) {
    if (encoder_.try_decode_exact<asset_record_t>(
            make_bytes_view(existing->data))) {
      return fail(kEntryPoint, error_code::duplicate_request);
    }
    if (existing->owner != context.program_id()) {
      return fail(kEntryPoint, error_code::not_owned_by_program);
    }
  }

  auto record = asset_record_t{};
  record.initialized = false;
  record.key = request.key;
  record.amount = 0;

  if (policy_ != uid_policy::none) {
    if (!slot.committee) {
      return fail(kEntryPoint, error_code::committee_not_initialized);
    }
    record.assigned_uid = slot.committee->request_counter;
    if (policy_ == uid_policy::assign_and_increment) {
      auto advanced = slot.committee.value();
      advanced.request_counter += 1;
      if (auto error =
              context.write_account(slot.address, encoder_.encode(advanced))) {
        return fail(kEntryPoint, *error);
      }
    }
  }

  if (auto error = store(context, asset_address, existing.has_value(),
                         encoder_.encode(record))) {
    return fail(kEntryPoint, *error);
  }
  auto ticker = std::string_view{
      reinterpret_cast<const char*>(request.key.ticker.data()),
      request.key.ticker.size()};
  spdlog::info("new request for key: height {} ticker {} uid {} at {}",
               request.key.height, ticker, record.assigned_uid,
               to_hex(asset_address));
  return std::nullopt;
}

program_result_t processor::insert_asset(invocation_context& context,
                                         const instruction_t& instruction,
                                         const insert_asset_t& request) {
  constexpr auto kEntryPoint = std::string_view{"insert_asset"};
  if (instruction.accounts.size() < 2) {
    return fail(kEntryPoint, error_code::not_enough_account_keys);
  }
  auto loaded = load_committee(encoder_, context, instruction);
  if (auto* error = std::get_if<error_code>(&loaded)) {
    return fail(kEntryPoint, *error);
  }
  auto& slot = std::get<committee_slot>(loaded);
  if (!slot.committee) {
    return fail(kEntryPoint, error_code::malformed_record);
  }

  auto asset_address = oracle::address::asset_address(encoder_, request.key,
                                                      context.program_id());
  if (oracle::address::verify_program_address(
          asset_address, instruction.accounts[kAssetAccountIndex])) {
    return fail(kEntryPoint, error_code::incorrect_asset_pda);
  }
  auto existing = context.load_account(asset_address);
  if (existing && existing->owner != context.program_id()) {
    return fail(kEntryPoint, error_code::not_owned_by_program);
  }
  auto stored = existing ? encoder_.try_decode_exact<asset_record_t>(
                               make_bytes_view(existing->data))
                         : std::nullopt;
  if (!stored) {
    return fail(kEntryPoint, error_code::request_not_initialized);
  }

  auto updated = asset_record_t{};
  updated.initialized = true;
  updated.assigned_uid = stored->assigned_uid;
  updated.key = request.key;
  updated.amount = request.amount;
  auto encoded = encoder_.encode(updated);

  if (auto error = verify_attestation(
          context.companion_instruction(), slot.committee->signer_address,
          make_bytes_view(encoded), make_bytes_view(request.signature))) {
    return fail(kEntryPoint, *error);
  }
  if (auto error = context.write_account(asset_address, std::move(encoded))) {
    return fail(kEntryPoint, *error);
  }
  spdlog::info("update asset: uid {} amount {} at {}", updated.assigned_uid,
               updated.amount.str(), to_hex(asset_address));
  return std::nullopt;
}

}  // namespace oracle::program
