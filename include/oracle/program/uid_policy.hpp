#pragma once

#include <oracle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace oracle::program {

/// How a newly opened asset record gets its `assigned_uid`.
enum class uid_policy : uint8_t {
  /// Always 0. The committee is not read.
  none = 0,
  /// Copy the committee request counter.
  assign = 1,
  /// Copy the committee request counter, then increment and persist it.
  assign_and_increment = 2
};

inline constexpr auto kUidPolicyMappings = std::array{
    std::pair<std::string_view, uid_policy>{"none", uid_policy::none},
    std::pair<std::string_view, uid_policy>{"assign", uid_policy::assign},
    std::pair<std::string_view, uid_policy>{"assign_and_increment",
                                            uid_policy::assign_and_increment},
};

}  // namespace oracle::program

namespace oracle::schema {

template <>
inline std::optional<oracle::program::uid_policy>
try_from_string<oracle::program::uid_policy>(const std::string_view value) {
  return from_string(value, oracle::program::kUidPolicyMappings);
}

}  // namespace oracle::schema

namespace oracle::program {

inline constexpr std::string_view to_string(const uid_policy value) {
  return oracle::schema::to_string(value, kUidPolicyMappings)
      .value_or("unknown");
}

}  // namespace oracle::program
