#include <ferry/schema/encoding/scale/ledger_config.hpp>

namespace ferry::schema {

void encode(const ledger_config<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.fee_collector, encoder);
}

void decode(ledger_config<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.fee_collector, decoder);
}

}  // namespace ferry::schema
