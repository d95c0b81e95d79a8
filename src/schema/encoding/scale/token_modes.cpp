#include <ferry/schema/encoding/scale/enums.hpp>
#include <ferry/schema/encoding/scale/token_modes.hpp>

namespace ferry::schema {

void encode(const token_modes<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.relocation_mode, encoder);
  encode(o.accommodation_mode, encoder);
}

void decode(token_modes<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.relocation_mode, decoder);
  decode(o.accommodation_mode, decoder);
}

}  // namespace ferry::schema
