#include <ferry/schema/encoding/scale/guard_config.hpp>

namespace ferry::schema {

void encode(const guard_config<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.time_frame, encoder);
  encode(o.volume_limit, encoder);
  encode(o.current_volume, encoder);
  encode(o.last_reset_time, encoder);
}

void decode(guard_config<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.time_frame, decoder);
  decode(o.volume_limit, decoder);
  decode(o.current_volume, decoder);
  decode(o.last_reset_time, decoder);
}

}  // namespace ferry::schema
