#include <oracle/schema/encoding/scale/account.hpp>

namespace oracle::schema {

void encode(const account_t& o, ::scale::Encoder& encoder) {
  encode(o.owner, encoder);
  encode(o.data, encoder);
}

void decode(account_t& o, ::scale::Decoder& decoder) {
  decode(o.owner, decoder);
  decode(o.data, decoder);
}

}  // namespace oracle::schema
