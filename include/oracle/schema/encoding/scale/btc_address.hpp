#pragma once
#include <oracle/schema/btc_address.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(oracle::schema,
                             network_t,
                             oracle::schema::network_t::bitcoin,
                             oracle::schema::network_t::testnet,
                             oracle::schema::network_t::signet,
                             oracle::schema::network_t::regtest)

namespace oracle::schema {

void encode(const p2pkh_t& o, ::scale::Encoder& encoder);
void decode(p2pkh_t& o, ::scale::Decoder& decoder);

void encode(const p2wpkh_t& o, ::scale::Encoder& encoder);
void decode(p2wpkh_t& o, ::scale::Decoder& decoder);

void encode(const p2tr_untweaked_t& o, ::scale::Encoder& encoder);
void decode(p2tr_untweaked_t& o, ::scale::Decoder& decoder);

void encode(const p2tr_tweaked_t& o, ::scale::Encoder& encoder);
void decode(p2tr_tweaked_t& o, ::scale::Decoder& decoder);

void encode(const btc_address_t& o, ::scale::Encoder& encoder);
void decode(btc_address_t& o, ::scale::Decoder& decoder);

}  // namespace oracle::schema
