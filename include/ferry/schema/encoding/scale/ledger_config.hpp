#pragma once
#include <ferry/schema/ledger_config.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ferry::schema {

void encode(const ledger_config<1>& o, ::scale::Encoder& encoder);
void decode(ledger_config<1>& o, ::scale::Decoder& decoder);

}  // namespace ferry::schema
