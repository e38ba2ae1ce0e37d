#pragma once
#include <oracle/schema/btc_address.hpp>
#include <oracle/schema/primitives.hpp>

// Schema type: asset key.
// Oracle workflow: Identity of one balance fact (snapshot height, ticker,
// owner). Hashed into the asset record address; immutable once opened.
namespace oracle::schema {

template <uint16_t Version>
struct asset_key;

template <>
struct asset_key<1> final {
  uint32_t height{};
  ticker_t ticker{};
  btc_address_t owner_address{};

  bool operator==(const asset_key<1>&) const = default;
};

using asset_key_t = asset_key<1>;

}  // namespace oracle::schema
