#include <oracle/schema/encoding/scale/transaction.hpp>

namespace oracle::schema {

void encode(const transaction_t& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.instructions, encoder);
}

void decode(transaction_t& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.instructions, decoder);
}

}  // namespace oracle::schema
