#include <blake3.h>
#include <oracle/blake3/hash.hpp>

namespace oracle::blake3 {

oracle::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = oracle::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

oracle::schema::hash32_t hash(const oracle::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = oracle::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

oracle::schema::hash32_t hash(
    std::initializer_list<oracle::schema::bytes_view_t> parts) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  for (const auto& part : parts) {
    blake3_hasher_update(&hasher, part.data(), part.size());
  }
  // BLAKE3_OUT_LEN
  auto output = oracle::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace oracle::blake3
