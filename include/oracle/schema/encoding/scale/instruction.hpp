#pragma once
#include <oracle/schema/instruction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace oracle::schema {

void encode(const instruction_t& o, ::scale::Encoder& encoder);
void decode(instruction_t& o, ::scale::Decoder& decoder);

}  // namespace oracle::schema
