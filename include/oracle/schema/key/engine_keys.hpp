#pragma once

#include <oracle/schema/primitives.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: engine keys.
// Oracle workflow: Canonical key prefixes and key codecs for host accounts
// and the committed checkpoint.
namespace oracle::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kCommittedStateKey{
    "SYS|APP|COMMITTED_STATE"};

inline constexpr std::array<std::string_view, 2> kEngineKeyspaces{
    kStatePrefix, kAccountKeyPrefix};

template <typename Encoder, typename T>
oracle::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
oracle::schema::bytes_t make_prefix_key(Encoder& encoder,
                                        std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
oracle::schema::bytes_t make_account_key(
    Encoder& encoder,
    const oracle::schema::address_t& address) {
  return make_prefixed_key(encoder, kAccountKeyPrefix, address);
}

/// Address suffix of an account key, or std::nullopt for any other key.
template <typename Encoder>
std::optional<oracle::schema::address_t> parse_account_key(
    Encoder& encoder,
    const oracle::schema::bytes_view_t& key) {
  auto prefix = make_prefix_key(encoder, kAccountKeyPrefix);
  if (key.size() != prefix.size() + sizeof(oracle::schema::address_t) ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  return oracle::schema::try_make_hash32(key.subspan(prefix.size()));
}

}  // namespace oracle::schema::key
