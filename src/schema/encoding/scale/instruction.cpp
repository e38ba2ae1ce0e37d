#include <oracle/schema/encoding/scale/instruction.hpp>

namespace oracle::schema {

void encode(const instruction_t& o, ::scale::Encoder& encoder) {
  encode(o.program_id, encoder);
  encode(o.accounts, encoder);
  encode(o.data, encoder);
}

void decode(instruction_t& o, ::scale::Decoder& decoder) {
  decode(o.program_id, decoder);
  decode(o.accounts, decoder);
  decode(o.data, decoder);
}

}  // namespace oracle::schema
