#pragma once
#include <oracle/schema/asset_key.hpp>
#include <oracle/schema/encoding/scale/btc_address.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace oracle::schema {

void encode(const asset_key_t& o, ::scale::Encoder& encoder);
void decode(asset_key_t& o, ::scale::Decoder& decoder);

}  // namespace oracle::schema
