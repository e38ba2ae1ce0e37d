#pragma once
#include <oracle/schema/error_code.hpp>
#include <oracle/schema/instruction.hpp>
#include <oracle/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>

namespace oracle::program {

/// Program id of the native ed25519 verification facility.
inline constexpr auto kEd25519ProgramId = oracle::schema::program_id_t{
    'E', 'd', '2', '5', '5', '1', '9', 'S', 'i', 'g', 'V',
    'e', 'r', 'i', 'f', 'y', '1', '1', '1', '1', '1', '1',
    '1', '1', '1', '1', '1', '1', '1', '1', '1', '1'};

// Companion payload layout for a single signature that references only its
// own instruction:
//   [0]       num_signatures = 1
//   [1]       padding = 0
//   [2..16)   seven little-endian u16 offset fields
//   [16..48)  public key
//   [48..112) signature
//   [112..)   message
inline constexpr auto kSignatureOffsetsStart = std::size_t{2};
inline constexpr auto kSignatureOffsetsSerializedSize = std::size_t{14};
inline constexpr auto kHeaderSize =
    kSignatureOffsetsStart + kSignatureOffsetsSerializedSize;
inline constexpr auto kPublicKeySize = std::size_t{32};
inline constexpr auto kSignatureSize = std::size_t{64};
inline constexpr auto kPublicKeyOffset = uint16_t{16};
inline constexpr auto kSignatureOffset = uint16_t{48};
inline constexpr auto kMessageOffset = uint16_t{112};
inline constexpr auto kCurrentInstructionIndex = uint16_t{0xFFFF};

/// Companion payload that attests `signature` over `message` by
/// `public_key`. The layout is exactly what verify_attestation expects.
oracle::schema::bytes_t make_attestation_data(
    const oracle::schema::public_key_t& public_key,
    const oracle::schema::bytes_view_t& message,
    const oracle::schema::bytes_view_t& signature);

/// Structural check that `companion` is the ed25519 facility attesting
/// exactly (`public_key`, `message`, `signature`). Cryptography already ran
/// on the host; this only compares bytes. Any mismatch, including a missing
/// companion, is error_code::invalid_signer.
oracle::schema::program_result_t verify_attestation(
    const oracle::schema::instruction_t* companion,
    const oracle::schema::public_key_t& public_key,
    const oracle::schema::bytes_view_t& message,
    const oracle::schema::bytes_view_t& signature);

}  // namespace oracle::program
