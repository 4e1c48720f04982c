#pragma once
#include <warden/schema/msp_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace warden::schema {

void encode(const msp_result<1>& o, ::scale::Encoder& encoder);
void decode(msp_result<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
