#include <oracle/schema/encoding/scale/oracle_instruction.hpp>

namespace oracle::schema {

void encode(const set_committee_t& o, ::scale::Encoder& encoder) {
  encode(o.committee, encoder);
  encode(o.signature, encoder);
}

void decode(set_committee_t& o, ::scale::Decoder& decoder) {
  decode(o.committee, decoder);
  decode(o.signature, decoder);
}

void encode(const request_asset_t& o, ::scale::Encoder& encoder) {
  encode(o.key, encoder);
}

void decode(request_asset_t& o, ::scale::Decoder& decoder) {
  decode(o.key, decoder);
}

void encode(const insert_asset_t& o, ::scale::Encoder& encoder) {
  encode(o.key, encoder);
  encode_amount(o.amount, encoder);
  encode(o.signature, encoder);
}

void decode(insert_asset_t& o, ::scale::Decoder& decoder) {
  decode(o.key, decoder);
  decode_amount(o.amount, decoder);
  decode(o.signature, decoder);
}

}  // namespace oracle::schema
