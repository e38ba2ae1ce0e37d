#pragma once
#include <oracle/schema/error_code.hpp>
#include <oracle/schema/instruction.hpp>

#include <cstddef>
#include <vector>

namespace oracle::host {

/// Native ed25519 verification facility.
///
/// Executes `instructions[index]`, whose data is a signature count, a padding
/// byte, one 14-byte offsets record per signature and the referenced bytes.
/// Offsets may point into any instruction of the transaction; index 0xFFFF is
/// the instruction itself. Every signature must verify, otherwise the result
/// is signature_verification_failed.
oracle::schema::program_result_t execute_ed25519_instruction(
    const std::vector<oracle::schema::instruction_t>& instructions,
    std::size_t index);

}  // namespace oracle::host
