#pragma once
#include <oracle/schema/asset_key.hpp>
#include <oracle/schema/committee.hpp>
#include <oracle/schema/primitives.hpp>

#include <variant>

// Schema type: oracle instruction.
// Oracle workflow: Payload of an instruction addressed to the oracle
// program. The variant index is the wire tag.
namespace oracle::schema {

/// Bootstrap or rotate the committee. `signature` is ignored at bootstrap.
template <uint16_t Version>
struct set_committee;

template <>
struct set_committee<1> final {
  committee_t committee{};
  bytes_t signature;
};

using set_committee_t = set_committee<1>;

/// Open an asset record for `key`. Unauthenticated.
template <uint16_t Version>
struct request_asset;

template <>
struct request_asset<1> final {
  asset_key_t key{};
};

using request_asset_t = request_asset<1>;

/// Attested amount for an already opened asset record.
template <uint16_t Version>
struct insert_asset;

template <>
struct insert_asset<1> final {
  asset_key_t key{};
  amount_t amount{};
  bytes_t signature;
};

using insert_asset_t = insert_asset<1>;

using oracle_instruction_t =
    std::variant<set_committee_t, request_asset_t, insert_asset_t>;

}  // namespace oracle::schema
