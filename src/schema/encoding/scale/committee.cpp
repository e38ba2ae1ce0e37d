#include <oracle/schema/encoding/scale/committee.hpp>

namespace oracle::schema {

void encode(const committee_t& o, ::scale::Encoder& encoder) {
  encode(o.change_id, encoder);
  encode(o.signer_address, encoder);
  encode(o.request_counter, encoder);
}

void decode(committee_t& o, ::scale::Decoder& decoder) {
  decode(o.change_id, decoder);
  decode(o.signer_address, decoder);
  decode(o.request_counter, decoder);
}

}  // namespace oracle::schema
