#pragma once
#include <dca/schema/dca_schedule.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared in the schema namespace so the codec finds them through ADL.
namespace dca::schema {

void encode(const dca_schedule<1>& o, ::scale::Encoder& encoder);
void decode(dca_schedule<1>& o, ::scale::Decoder& decoder);

}  // namespace dca::schema
