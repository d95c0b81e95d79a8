#pragma once
#include <ferry/schema/event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ferry::schema {

void encode(const event_attribute<1>& o, ::scale::Encoder& encoder);
void decode(event_attribute<1>& o, ::scale::Decoder& decoder);

void encode(const event<1>& o, ::scale::Encoder& encoder);
void decode(event<1>& o, ::scale::Decoder& decoder);

}  // namespace ferry::schema
