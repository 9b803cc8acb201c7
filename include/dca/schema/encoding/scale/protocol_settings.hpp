#pragma once
#include <dca/schema/protocol_settings.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace dca::schema {

void encode(const protocol_settings<1>& o, ::scale::Encoder& encoder);
void decode(protocol_settings<1>& o, ::scale::Decoder& decoder);

}  // namespace dca::schema
