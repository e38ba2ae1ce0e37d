#pragma once

#include <oracle/schema/enum_string.hpp>
#include <oracle/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// Schema type: bitcoin owner address.
// Oracle workflow: The owner part of an asset key. Stored as key material
// rather than as a rendered address string so every encoding variant has a
// single canonical byte form.
namespace oracle::schema {

enum class network_t : uint8_t {
  bitcoin = 0,
  testnet = 1,
  signet = 2,
  regtest = 3
};

inline constexpr auto kNetworkMappings = std::array{
    std::pair<std::string_view, network_t>{"bitcoin", network_t::bitcoin},
    std::pair<std::string_view, network_t>{"testnet", network_t::testnet},
    std::pair<std::string_view, network_t>{"signet", network_t::signet},
    std::pair<std::string_view, network_t>{"regtest", network_t::regtest},
};

template <>
inline std::optional<network_t> try_from_string<network_t>(
    const std::string_view value) {
  return from_string(value, kNetworkMappings);
}

inline constexpr std::string_view to_string(const network_t value) {
  return to_string(value, kNetworkMappings).value_or("unknown");
}

using compressed_public_key_t = std::array<uint8_t, 33>;
using x_only_public_key_t = std::array<uint8_t, 32>;

/// Legacy pay-to-pubkey-hash.
struct p2pkh_t final {
  compressed_public_key_t public_key{};
  bool operator==(const p2pkh_t&) const = default;
};

/// Segwit v0 pay-to-witness-pubkey-hash.
struct p2wpkh_t final {
  compressed_public_key_t public_key{};
  bool operator==(const p2wpkh_t&) const = default;
};

/// Taproot output described by its internal key. An all-zero tweak hash
/// means the output commits to no script tree.
struct p2tr_untweaked_t final {
  x_only_public_key_t internal_key{};
  hash32_t tap_tweak_hash{};
  bool operator==(const p2tr_untweaked_t&) const = default;
};

/// Taproot output described by its already tweaked output key.
struct p2tr_tweaked_t final {
  x_only_public_key_t output_key{};
  bool operator==(const p2tr_tweaked_t&) const = default;
};

using address_type_t =
    std::variant<p2pkh_t, p2wpkh_t, p2tr_untweaked_t, p2tr_tweaked_t>;

template <uint16_t Version>
struct btc_address;

template <>
struct btc_address<1> final {
  network_t network{network_t::bitcoin};
  address_type_t address_type{};

  bool operator==(const btc_address<1>&) const = default;
};

using btc_address_t = btc_address<1>;

std::optional<btc_address_t> make_p2pkh(network_t network,
                                        const bytes_view_t& compressed_pk,
                                        std::string& error);

std::optional<btc_address_t> make_p2wpkh(network_t network,
                                         const bytes_view_t& compressed_pk,
                                         std::string& error);

std::optional<btc_address_t> make_p2tr_untweaked(
    network_t network,
    const bytes_view_t& internal_key,
    const std::optional<bytes_view_t>& tap_tweak_hash,
    std::string& error);

std::optional<btc_address_t> make_p2tr_tweaked(network_t network,
                                               const bytes_view_t& tweaked_pk,
                                               std::string& error);

}  // namespace oracle::schema
