#pragma once
#include <oracle/schema/primitives.hpp>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace oracle::blake3 {

oracle::schema::hash32_t hash(const std::string_view& str);
oracle::schema::hash32_t hash(const oracle::schema::bytes_view_t& bytes);

/// Hash of the concatenation of `parts`, without materialising it.
oracle::schema::hash32_t hash(
    std::initializer_list<oracle::schema::bytes_view_t> parts);

}  // namespace oracle::blake3
