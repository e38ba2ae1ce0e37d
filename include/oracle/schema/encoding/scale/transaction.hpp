#pragma once
#include <oracle/schema/encoding/scale/instruction.hpp>
#include <oracle/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace oracle::schema {

void encode(const transaction_t& o, ::scale::Encoder& encoder);
void decode(transaction_t& o, ::scale::Decoder& decoder);

}  // namespace oracle::schema
