#include <ferry/schema/encoding/scale/chain_counters.hpp>

namespace ferry::schema {

void encode(const chain_counters<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.pending_relocation_count, encoder);
  encode(o.last_processed_relocation_nonce, encoder);
  encode(o.last_accommodation_nonce, encoder);
}

void decode(chain_counters<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.pending_relocation_count, decoder);
  decode(o.last_processed_relocation_nonce, decoder);
  decode(o.last_accommodation_nonce, decoder);
}

}  // namespace ferry::schema
