#pragma once
#include <oracle/schema/account.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace oracle::schema {

void encode(const account_t& o, ::scale::Encoder& encoder);
void decode(account_t& o, ::scale::Decoder& decoder);

}  // namespace oracle::schema
