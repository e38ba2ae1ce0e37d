#include <oracle/address/derive.hpp>
#include <oracle/blake3/hash.hpp>
#include <oracle/common/critical.hpp>
#include <oracle/crypto/verify.hpp>
#include <oracle/schema/asset_record.hpp>

#include <blake3.h>
#include <array>

namespace oracle::address {

std::optional<oracle::schema::address_t> create_program_address(
    const seeds_t& seeds,
    const oracle::schema::program_id_t& program_id) {
  if (seeds.size() > kMaxSeeds) {
    return std::nullopt;
  }
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  for (const auto& seed : seeds) {
    if (seed.size() > kMaxSeedLength) {
      return std::nullopt;
    }
    blake3_hasher_update(&hasher, seed.data(), seed.size());
  }
  blake3_hasher_update(&hasher, program_id.data(), program_id.size());
  blake3_hasher_update(&hasher, kDerivedAddressMarker.data(),
                       kDerivedAddressMarker.size());
  auto address = oracle::schema::address_t{};
  blake3_hasher_finalize(&hasher, address.data(), address.size());

  if (oracle::crypto::is_on_curve(address)) {
    return std::nullopt;
  }
  return address;
}

std::optional<derived_address_t> find_program_address(
    const seeds_t& seeds,
    const oracle::schema::program_id_t& program_id) {
  if (seeds.size() >= kMaxSeeds) {
    return std::nullopt;
  }
  auto bump = std::array<uint8_t, 1>{};
  auto bumped = seeds;
  bumped.push_back(oracle::schema::bytes_view_t{bump.data(), bump.size()});
  for (auto candidate = 255; candidate >= 0; --candidate) {
    bump[0] = static_cast<uint8_t>(candidate);
    if (auto address = create_program_address(bumped, program_id)) {
      return derived_address_t{*address, bump[0]};
    }
  }
  return std::nullopt;
}

oracle::schema::address_t committee_address(
    const oracle::schema::program_id_t& program_id) {
  auto derived = find_program_address(
      seeds_t{oracle::schema::make_bytes_view(
          oracle::schema::kCommitteeNamespace)},
      program_id);
  if (!derived) {
    oracle::common::critical("unable to derive committee address");
  }
  return derived->first;
}

oracle::schema::address_t asset_address(
    oracle::schema::encoding::encoder<
        oracle::schema::encoding::scale_encoder_tag>& encoder,
    const oracle::schema::asset_key_t& key,
    const oracle::schema::program_id_t& program_id) {
  auto encoded_key = encoder.encode(key);
  auto key_hash = oracle::blake3::hash(oracle::schema::make_bytes_view(
      encoded_key));
  auto derived = find_program_address(
      seeds_t{oracle::schema::make_bytes_view(oracle::schema::kAssetNamespace),
              oracle::schema::bytes_view_t{key_hash.data(), key_hash.size()}},
      program_id);
  if (!derived) {
    oracle::common::critical("unable to derive asset address");
  }
  return derived->first;
}

oracle::schema::program_result_t verify_program_address(
    const oracle::schema::address_t& expected,
    const oracle::schema::address_t& supplied) {
  if (expected != supplied) {
    return oracle::schema::error_code::address_mismatch;
  }
  return std::nullopt;
}

}  // namespace oracle::address
