#pragma once
#include <ferry/schema/relocation.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ferry::schema {

void encode(const relocation<1>& o, ::scale::Encoder& encoder);
void decode(relocation<1>& o, ::scale::Decoder& decoder);

}  // namespace ferry::schema
