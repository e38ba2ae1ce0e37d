#pragma once
#include <oracle/schema/primitives.hpp>
#include <optional>
#include <span>

namespace oracle::schema::encoding {

// Build time choice of wire library. Code that needs bytes takes an
// encoder<Library>& and never names the library directly.
template <typename Library>
struct encoder {
  template <typename T>
  oracle::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, oracle::schema::bytes_t& out);

  template <typename T>
  T decode(const oracle::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const oracle::schema::bytes_view_t& bytes);

  /// Strict decode: succeeds only if `bytes` is exactly the canonical
  /// encoding of the returned value (no trailing or missing bytes).
  template <typename T>
  std::optional<T> try_decode_exact(const oracle::schema::bytes_view_t& bytes);
};

}  // namespace oracle::schema::encoding
