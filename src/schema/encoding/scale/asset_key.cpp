#include <oracle/schema/encoding/scale/asset_key.hpp>

namespace oracle::schema {

void encode(const asset_key_t& o, ::scale::Encoder& encoder) {
  encode(o.height, encoder);
  encode(o.ticker, encoder);
  encode(o.owner_address, encoder);
}

void decode(asset_key_t& o, ::scale::Decoder& decoder) {
  decode(o.height, decoder);
  decode(o.ticker, decoder);
  decode(o.owner_address, decoder);
}

}  // namespace oracle::schema
