#include <oracle/schema/encoding/scale/btc_address.hpp>

namespace oracle::schema {

void encode(const p2pkh_t& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(p2pkh_t& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

void encode(const p2wpkh_t& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(p2wpkh_t& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

void encode(const p2tr_untweaked_t& o, ::scale::Encoder& encoder) {
  encode(o.internal_key, encoder);
  encode(o.tap_tweak_hash, encoder);
}

void decode(p2tr_untweaked_t& o, ::scale::Decoder& decoder) {
  decode(o.internal_key, decoder);
  decode(o.tap_tweak_hash, decoder);
}

void encode(const p2tr_tweaked_t& o, ::scale::Encoder& encoder) {
  encode(o.output_key, encoder);
}

void decode(p2tr_tweaked_t& o, ::scale::Decoder& decoder) {
  decode(o.output_key, decoder);
}

void encode(const btc_address_t& o, ::scale::Encoder& encoder) {
  encode(o.network, encoder);
  encode(o.address_type, encoder);
}

void decode(btc_address_t& o, ::scale::Decoder& decoder) {
  decode(o.network, decoder);
  decode(o.address_type, decoder);
}

}  // namespace oracle::schema
