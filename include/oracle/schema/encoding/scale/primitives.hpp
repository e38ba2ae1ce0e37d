#pragma once
#include <oracle/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace oracle::schema {

// u128 travels as two little-endian u64 words, low word first, which is the
// 16-byte little-endian integer.
void encode_amount(const amount_t& o, ::scale::Encoder& encoder);
void decode_amount(amount_t& o, ::scale::Decoder& decoder);

}  // namespace oracle::schema
