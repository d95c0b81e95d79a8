#include <ferry/schema/encoding/scale/enums.hpp>
#include <ferry/schema/encoding/scale/relocation.hpp>

namespace ferry::schema {

void encode(const relocation<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.token, encoder);
  encode(o.account, encoder);
  encode(o.amount, encoder);
  encode(o.status, encoder);
  encode(o.fee, encoder);
  encode(o.old_nonce, encoder);
  encode(o.new_nonce, encoder);
}

void decode(relocation<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.token, decoder);
  decode(o.account, decoder);
  decode(o.amount, decoder);
  decode(o.status, decoder);
  decode(o.fee, decoder);
  decode(o.old_nonce, decoder);
  decode(o.new_nonce, decoder);
}

}  // namespace ferry::schema
