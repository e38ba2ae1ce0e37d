#pragma once
#include <oracle/common/critical.hpp>
#include <oracle/schema/encoding/encoder.hpp>
#include <oracle/schema/encoding/scale/account.hpp>
#include <oracle/schema/encoding/scale/asset_key.hpp>
#include <oracle/schema/encoding/scale/asset_record.hpp>
#include <oracle/schema/encoding/scale/btc_address.hpp>
#include <oracle/schema/encoding/scale/committee.hpp>
#include <oracle/schema/encoding/scale/instruction.hpp>
#include <oracle/schema/encoding/scale/oracle_instruction.hpp>
#include <oracle/schema/encoding/scale/primitives.hpp>
#include <oracle/schema/encoding/scale/transaction.hpp>
#include <algorithm>
#include <iterator>
#include <scale/scale.hpp>

namespace oracle::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  oracle::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, oracle::schema::bytes_t& out);

  template <typename T>
  T decode(const oracle::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const oracle::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode_exact(const oracle::schema::bytes_view_t& bytes);
};

template <typename T>
oracle::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    oracle::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        oracle::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const oracle::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    oracle::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const oracle::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode_exact(
    const oracle::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  auto reencoded = ::scale::impl::memory::encode(decoded.value());
  if (!reencoded) {
    return std::nullopt;
  }
  const auto& canonical = reencoded.value();
  if (!std::equal(std::begin(canonical), std::end(canonical),
                  std::begin(bytes), std::end(bytes))) {
    return std::nullopt;
  }
  return decoded;
}

}  // namespace oracle::schema::encoding
