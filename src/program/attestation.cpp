#include <oracle/program/attestation.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <limits>

namespace oracle::program {

namespace {

void append_u16(oracle::schema::bytes_t& out, uint16_t value) {
  out.push_back(static_cast<uint8_t>(value & 0xff));
  out.push_back(static_cast<uint8_t>(value >> 8));
}

std::array<uint8_t, kHeaderSize> expected_header(uint16_t message_size) {
  auto header = oracle::schema::bytes_t{};
  header.reserve(kHeaderSize);
  header.push_back(1);
  header.push_back(0);
  append_u16(header, kSignatureOffset);
  append_u16(header, kCurrentInstructionIndex);
  append_u16(header, kPublicKeyOffset);
  append_u16(header, kCurrentInstructionIndex);
  append_u16(header, kMessageOffset);
  append_u16(header, message_size);
  append_u16(header, kCurrentInstructionIndex);

  auto out = std::array<uint8_t, kHeaderSize>{};
  std::copy(std::begin(header), std::end(header), std::begin(out));
  return out;
}

bool span_equals(const oracle::schema::bytes_t& data,
                 std::size_t offset,
                 const oracle::schema::bytes_view_t& expected) {
  return std::equal(std::begin(expected), std::end(expected),
                    std::begin(data) + static_cast<std::ptrdiff_t>(offset));
}

oracle::schema::program_result_t reject(const char* reason) {
  spdlog::debug("Attestation rejected: {}", reason);
  return oracle::schema::error_code::invalid_signer;
}

}  // namespace

oracle::schema::bytes_t make_attestation_data(
    const oracle::schema::public_key_t& public_key,
    const oracle::schema::bytes_view_t& message,
    const oracle::schema::bytes_view_t& signature) {
  auto header = expected_header(static_cast<uint16_t>(message.size()));
  auto data = oracle::schema::bytes_t{};
  data.reserve(kMessageOffset + message.size());
  data.insert(std::end(data), std::begin(header), std::end(header));
  data.insert(std::end(data), std::begin(public_key), std::end(public_key));
  data.insert(std::end(data), std::begin(signature), std::end(signature));
  data.insert(std::end(data), std::begin(message), std::end(message));
  return data;
}

oracle::schema::program_result_t verify_attestation(
    const oracle::schema::instruction_t* companion,
    const oracle::schema::public_key_t& public_key,
    const oracle::schema::bytes_view_t& message,
    const oracle::schema::bytes_view_t& signature) {
  if (companion == nullptr) {
    return reject("no companion instruction");
  }
  if (companion->program_id != kEd25519ProgramId ||
      !companion->accounts.empty()) {
    return reject("companion is not the ed25519 facility");
  }
  if (message.size() > std::numeric_limits<uint16_t>::max() ||
      signature.size() != kSignatureSize) {
    return reject("expected message or signature out of range");
  }

  const auto& data = companion->data;
  if (data.size() !=
      kHeaderSize + kSignatureSize + kPublicKeySize + message.size()) {
    return reject("companion data length mismatch");
  }

  auto header = expected_header(static_cast<uint16_t>(message.size()));
  if (!std::equal(std::begin(header), std::end(header), std::begin(data))) {
    return reject("companion header mismatch");
  }
  if (!span_equals(data, kPublicKeyOffset,
                   oracle::schema::bytes_view_t{public_key.data(),
                                                public_key.size()})) {
    return reject("public key mismatch");
  }
  if (!span_equals(data, kSignatureOffset, signature)) {
    return reject("signature mismatch");
  }
  if (!span_equals(data, kMessageOffset, message)) {
    return reject("message mismatch");
  }
  return std::nullopt;
}

}  // namespace oracle::program
