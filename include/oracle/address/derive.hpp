#pragma once
#include <oracle/schema/asset_key.hpp>
#include <oracle/schema/encoding/scale/encoder.hpp>
#include <oracle/schema/error_code.hpp>
#include <oracle/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

// Deterministic record addressing. Derived addresses are never valid
// ed25519 public keys, so no private key can sign for them and only the
// owning program can write there.
namespace oracle::address {

inline constexpr auto kMaxSeeds = std::size_t{16};
inline constexpr auto kMaxSeedLength = std::size_t{32};
inline constexpr auto kDerivedAddressMarker =
    std::string_view{"ProgramDerivedAddress"};

using seeds_t = std::vector<oracle::schema::bytes_view_t>;
using derived_address_t = std::pair<oracle::schema::address_t, uint8_t>;

/// blake3(seed_0 || ... || seed_n || program_id || marker), or std::nullopt
/// when the seeds are out of bounds or the digest lands on the curve.
std::optional<oracle::schema::address_t> create_program_address(
    const seeds_t& seeds,
    const oracle::schema::program_id_t& program_id);

/// First off-curve address found by appending a bump byte, tried from 255
/// down to 0.
std::optional<derived_address_t> find_program_address(
    const seeds_t& seeds,
    const oracle::schema::program_id_t& program_id);

oracle::schema::address_t committee_address(
    const oracle::schema::program_id_t& program_id);

oracle::schema::address_t asset_address(
    oracle::schema::encoding::encoder<
        oracle::schema::encoding::scale_encoder_tag>& encoder,
    const oracle::schema::asset_key_t& key,
    const oracle::schema::program_id_t& program_id);

oracle::schema::program_result_t verify_program_address(
    const oracle::schema::address_t& expected,
    const oracle::schema::address_t& supplied);

}  // namespace oracle::address
