#pragma once
#include <oracle/schema/primitives.hpp>

// Schema type: committee.
// Oracle workflow: Singleton authority record. Its signer attests asset
// amounts and authorizes its own succession.
namespace oracle::schema {

template <uint16_t Version>
struct committee;

template <>
struct committee<1> final {
  /// Strictly incrementing rotation id, 0 at bootstrap.
  uint8_t change_id{};
  public_key_t signer_address{};
  /// Source of asset record uids.
  uint64_t request_counter{};

  bool operator==(const committee<1>&) const = default;
};

using committee_t = committee<1>;

}  // namespace oracle::schema
