#pragma once
#include <ferry/schema/token_modes.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ferry::schema {

void encode(const token_modes<1>& o, ::scale::Encoder& encoder);
void decode(token_modes<1>& o, ::scale::Decoder& decoder);

}  // namespace ferry::schema
