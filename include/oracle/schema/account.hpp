#pragma once
#include <oracle/schema/primitives.hpp>

// Schema type: account.
// Oracle workflow: Host ledger cell. The owner is the only program allowed
// to write `data`.
namespace oracle::schema {

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  address_t owner{};
  bytes_t data;

  bool operator==(const account<1>&) const = default;
};

using account_t = account<1>;

}  // namespace oracle::schema
