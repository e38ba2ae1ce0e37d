#include <oracle/crypto/verify.hpp>
#include <oracle/host/ed25519_program.hpp>
#include <oracle/program/attestation.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <optional>

using namespace oracle::schema;

namespace oracle::host {

namespace {

struct signature_offsets final {
  uint16_t signature_offset{};
  uint16_t signature_instruction_index{};
  uint16_t public_key_offset{};
  uint16_t public_key_instruction_index{};
  uint16_t message_data_offset{};
  uint16_t message_data_size{};
  uint16_t message_instruction_index{};
};

uint16_t read_u16(const bytes_t& data, std::size_t offset) {
  return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

signature_offsets read_offsets(const bytes_t& data, std::size_t start) {
  return signature_offsets{
      .signature_offset = read_u16(data, start),
      .signature_instruction_index = read_u16(data, start + 2),
      .public_key_offset = read_u16(data, start + 4),
      .public_key_instruction_index = read_u16(data, start + 6),
      .message_data_offset = read_u16(data, start + 8),
      .message_data_size = read_u16(data, start + 10),
      .message_instruction_index = read_u16(data, start + 12)};
}

std::optional<bytes_view_t> referenced_span(
    const std::vector<instruction_t>& instructions,
    std::size_t current,
    uint16_t instruction_index,
    uint16_t offset,
    std::size_t size) {
  auto source_index = current;
  if (instruction_index != oracle::program::kCurrentInstructionIndex) {
    if (instruction_index >= instructions.size()) {
      return std::nullopt;
    }
    source_index = instruction_index;
  }
  const auto& source = instructions[source_index].data;
  if (static_cast<std::size_t>(offset) + size > source.size()) {
    return std::nullopt;
  }
  return bytes_view_t{source.data() + offset, size};
}

program_result_t fail(const char* reason) {
  spdlog::debug("ed25519 facility rejected instruction: {}", reason);
  return error_code::signature_verification_failed;
}

}  // namespace

program_result_t execute_ed25519_instruction(
    const std::vector<instruction_t>& instructions,
    std::size_t index) {
  const auto& data = instructions[index].data;
  if (data.size() < oracle::program::kSignatureOffsetsStart) {
    return fail("data shorter than header");
  }
  auto num_signatures = static_cast<std::size_t>(data[0]);
  if (num_signatures == 0 &&
      data.size() > oracle::program::kSignatureOffsetsStart) {
    return fail("zero signatures with trailing data");
  }
  auto expected_size =
      oracle::program::kSignatureOffsetsStart +
      num_signatures * oracle::program::kSignatureOffsetsSerializedSize;
  if (data.size() < expected_size) {
    return fail("offsets table truncated");
  }

  for (auto i = std::size_t{0}; i < num_signatures; ++i) {
    auto offsets = read_offsets(
        data, oracle::program::kSignatureOffsetsStart +
                  i * oracle::program::kSignatureOffsetsSerializedSize);

    auto signature_bytes = referenced_span(
        instructions, index, offsets.signature_instruction_index,
        offsets.signature_offset, oracle::program::kSignatureSize);
    if (!signature_bytes) {
      return fail("signature out of bounds");
    }
    auto public_key_bytes = referenced_span(
        instructions, index, offsets.public_key_instruction_index,
        offsets.public_key_offset, oracle::program::kPublicKeySize);
    if (!public_key_bytes) {
      return fail("public key out of bounds");
    }
    auto message = referenced_span(
        instructions, index, offsets.message_instruction_index,
        offsets.message_data_offset, offsets.message_data_size);
    if (!message) {
      return fail("message out of bounds");
    }

    auto public_key = public_key_t{};
    std::copy(std::begin(*public_key_bytes), std::end(*public_key_bytes),
              std::begin(public_key));
    auto signature = ed25519_signature_t{};
    std::copy(std::begin(*signature_bytes), std::end(*signature_bytes),
              std::begin(signature));
    if (!oracle::crypto::verify_signature(*message, public_key, signature)) {
      return fail("signature does not verify");
    }
  }
  return std::nullopt;
}

}  // namespace oracle::host
