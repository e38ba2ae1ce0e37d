#pragma once
#include <oracle/schema/primitives.hpp>

#include <vector>

// Schema type: instruction.
// Oracle workflow: One program invocation inside a transaction: target
// program, ordered account addresses and opaque data.
namespace oracle::schema {

template <uint16_t Version>
struct instruction;

template <>
struct instruction<1> final {
  program_id_t program_id{};
  std::vector<address_t> accounts;
  bytes_t data;

  bool operator==(const instruction<1>&) const = default;
};

using instruction_t = instruction<1>;

}  // namespace oracle::schema
