#pragma once
#include <oracle/schema/encoding/scale/asset_key.hpp>
#include <oracle/schema/encoding/scale/committee.hpp>
#include <oracle/schema/encoding/scale/primitives.hpp>
#include <oracle/schema/oracle_instruction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace oracle::schema {

void encode(const set_committee_t& o, ::scale::Encoder& encoder);
void decode(set_committee_t& o, ::scale::Decoder& decoder);

void encode(const request_asset_t& o, ::scale::Encoder& encoder);
void decode(request_asset_t& o, ::scale::Decoder& decoder);

void encode(const insert_asset_t& o, ::scale::Encoder& encoder);
void decode(insert_asset_t& o, ::scale::Decoder& decoder);

}  // namespace oracle::schema
