#pragma once
#include <oracle/schema/primitives.hpp>
#include <optional>
#include <vector>

namespace oracle::storage {

using key_value_entry_t =
    std::pair<oracle::schema::bytes_t, oracle::schema::bytes_t>;

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  oracle::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const oracle::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const oracle::schema::bytes_view_t& key,
           const T& value);

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const oracle::schema::bytes_view_t& prefix) const;

  /// Atomically write `entries` together with the committed checkpoint.
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace oracle::storage
