#include <oracle/schema/encoding/scale/asset_record.hpp>

namespace oracle::schema {

void encode(const asset_record_t& o, ::scale::Encoder& encoder) {
  encode(o.namespace_tag, encoder);
  encode(o.initialized, encoder);
  encode(o.assigned_uid, encoder);
  encode(o.key, encoder);
  encode_amount(o.amount, encoder);
}

void decode(asset_record_t& o, ::scale::Decoder& decoder) {
  decode(o.namespace_tag, decoder);
  decode(o.initialized, decoder);
  decode(o.assigned_uid, decoder);
  decode(o.key, decoder);
  decode_amount(o.amount, decoder);
}

}  // namespace oracle::schema
