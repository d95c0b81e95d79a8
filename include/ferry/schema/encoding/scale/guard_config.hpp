#pragma once
#include <ferry/schema/guard_config.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ferry::schema {

void encode(const guard_config<1>& o, ::scale::Encoder& encoder);
void decode(guard_config<1>& o, ::scale::Decoder& decoder);

}  // namespace ferry::schema
