#pragma once
#include <warden/schema/serialized_identity.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace warden::schema {

void encode(const serialized_identity<1>& o, ::scale::Encoder& encoder);
void decode(serialized_identity<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
