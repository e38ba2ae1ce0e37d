#include <oracle/schema/encoding/scale/primitives.hpp>

#include <limits>

namespace oracle::schema {

void encode_amount(const amount_t& o, ::scale::Encoder& encoder) {
  auto low = static_cast<uint64_t>(o & std::numeric_limits<uint64_t>::max());
  auto high = static_cast<uint64_t>(o >> 64);
  encode(low, encoder);
  encode(high, encoder);
}

void decode_amount(amount_t& o, ::scale::Decoder& decoder) {
  auto low = uint64_t{};
  auto high = uint64_t{};
  decode(low, decoder);
  decode(high, decoder);
  o = (amount_t{high} << 64) | amount_t{low};
}

}  // namespace oracle::schema
