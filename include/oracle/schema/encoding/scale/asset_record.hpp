#pragma once
#include <oracle/schema/asset_record.hpp>
#include <oracle/schema/encoding/scale/asset_key.hpp>
#include <oracle/schema/encoding/scale/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace oracle::schema {

void encode(const asset_record_t& o, ::scale::Encoder& encoder);
void decode(asset_record_t& o, ::scale::Decoder& decoder);

}  // namespace oracle::schema
