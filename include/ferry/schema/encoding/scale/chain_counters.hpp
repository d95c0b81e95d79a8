#pragma once
#include <ferry/schema/chain_counters.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ferry::schema {

void encode(const chain_counters<1>& o, ::scale::Encoder& encoder);
void decode(chain_counters<1>& o, ::scale::Decoder& decoder);

}  // namespace ferry::schema
