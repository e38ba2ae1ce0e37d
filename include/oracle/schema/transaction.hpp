#pragma once
#include <oracle/schema/instruction.hpp>
#include <oracle/schema/primitives.hpp>

#include <vector>

namespace oracle::schema {

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  std::vector<instruction_t> instructions;
};

using transaction_t = transaction<1>;

}  // namespace oracle::schema
