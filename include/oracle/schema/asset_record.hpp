#pragma once
#include <oracle/schema/asset_key.hpp>
#include <oracle/schema/primitives.hpp>

#include <array>
#include <string_view>

// Schema type: asset record.
// Oracle workflow: Attested balance for one asset key. Opened by a request
// with a zero amount, then overwritten by committee attested inserts.
namespace oracle::schema {

using namespace_tag_t = std::array<uint8_t, 5>;

inline constexpr auto kAssetNamespace = std::string_view{"Asset"};
inline constexpr auto kCommitteeNamespace = std::string_view{"Committee"};
inline constexpr auto kAssetNamespaceTag =
    namespace_tag_t{'A', 's', 's', 'e', 't'};

template <uint16_t Version>
struct asset_record;

template <>
struct asset_record<1> final {
  /// Constant prefix so record accounts can be filtered by their first bytes.
  namespace_tag_t namespace_tag{kAssetNamespaceTag};
  bool initialized{};
  uint64_t assigned_uid{};
  asset_key_t key{};
  amount_t amount{};

  bool operator==(const asset_record<1>&) const = default;
};

using asset_record_t = asset_record<1>;

}  // namespace oracle::schema
