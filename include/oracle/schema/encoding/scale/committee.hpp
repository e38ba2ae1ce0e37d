#pragma once
#include <oracle/schema/committee.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace oracle::schema {

void encode(const committee_t& o, ::scale::Encoder& encoder);
void decode(committee_t& o, ::scale::Decoder& decoder);

}  // namespace oracle::schema
