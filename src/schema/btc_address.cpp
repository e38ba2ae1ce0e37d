#include <oracle/schema/btc_address.hpp>

#include <algorithm>
#include <iterator>

namespace oracle::schema {

namespace {

template <std::size_t N>
std::optional<std::array<uint8_t, N>> copy_exact(const bytes_view_t& bytes) {
  if (bytes.size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(out));
  return out;
}

}  // namespace

std::optional<btc_address_t> make_p2pkh(network_t network,
                                        const bytes_view_t& compressed_pk,
                                        std::string& error) {
  auto key = copy_exact<33>(compressed_pk);
  if (!key) {
    error = "invalid p2pkh compressed_pk length";
    return std::nullopt;
  }
  return btc_address_t{.network = network,
                       .address_type = p2pkh_t{.public_key = *key}};
}

std::optional<btc_address_t> make_p2wpkh(network_t network,
                                         const bytes_view_t& compressed_pk,
                                         std::string& error) {
  auto key = copy_exact<33>(compressed_pk);
  if (!key) {
    error = "invalid p2wpkh compressed_pk length";
    return std::nullopt;
  }
  return btc_address_t{.network = network,
                       .address_type = p2wpkh_t{.public_key = *key}};
}

std::optional<btc_address_t> make_p2tr_untweaked(
    network_t network,
    const bytes_view_t& internal_key,
    const std::optional<bytes_view_t>& tap_tweak_hash,
    std::string& error) {
  auto key = copy_exact<32>(internal_key);
  if (!key) {
    error = "invalid internal_key length";
    return std::nullopt;
  }
  auto untweaked = p2tr_untweaked_t{.internal_key = *key, .tap_tweak_hash = {}};
  if (tap_tweak_hash.has_value()) {
    auto hash = copy_exact<32>(*tap_tweak_hash);
    if (!hash) {
      error = "invalid tap_tweak_hash length";
      return std::nullopt;
    }
    untweaked.tap_tweak_hash = *hash;
  }
  return btc_address_t{.network = network, .address_type = untweaked};
}

std::optional<btc_address_t> make_p2tr_tweaked(network_t network,
                                               const bytes_view_t& tweaked_pk,
                                               std::string& error) {
  auto key = copy_exact<32>(tweaked_pk);
  if (!key) {
    error = "invalid tweaked_pk length";
    return std::nullopt;
  }
  return btc_address_t{.network = network,
                       .address_type = p2tr_tweaked_t{.output_key = *key}};
}

}  // namespace oracle::schema
