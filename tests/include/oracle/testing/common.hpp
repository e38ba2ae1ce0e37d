#pragma once

#include <oracle/schema/asset_key.hpp>
#include <oracle/schema/btc_address.hpp>
#include <oracle/schema/encoding/scale/encoder.hpp>
#include <oracle/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace oracle::testing {

using scale_encoder_t = oracle::schema::encoding::encoder<
    oracle::schema::encoding::scale_encoder_tag>;

inline oracle::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = oracle::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline oracle::schema::program_id_t make_program_id() {
  return make_hash(0x70);
}

inline oracle::schema::btc_address_t make_owner(const uint8_t seed) {
  auto tweaked = oracle::schema::p2tr_tweaked_t{};
  for (std::size_t i = 0; i < tweaked.output_key.size(); ++i) {
    tweaked.output_key[i] = static_cast<uint8_t>(seed ^ static_cast<uint8_t>(i));
  }
  return oracle::schema::btc_address_t{
      .network = oracle::schema::network_t::bitcoin,
      .address_type = tweaked};
}

inline oracle::schema::asset_key_t make_asset_key(
    const uint32_t height,
    const std::string_view ticker,
    const uint8_t owner_seed = 0x11) {
  return oracle::schema::asset_key_t{
      .height = height,
      .ticker = oracle::schema::make_ticker(ticker),
      .owner_address = make_owner(owner_seed)};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace oracle::testing
