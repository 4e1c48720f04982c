#pragma once
#include <warden/schema/msp_config.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE codec.
namespace warden::schema {

void encode(const key_info<1>& o, ::scale::Encoder& encoder);
void decode(key_info<1>& o, ::scale::Decoder& decoder);

void encode(const signing_identity_info<1>& o, ::scale::Encoder& encoder);
void decode(signing_identity_info<1>& o, ::scale::Decoder& decoder);

void encode(const x509_msp_config<1>& o, ::scale::Encoder& encoder);
void decode(x509_msp_config<1>& o, ::scale::Decoder& decoder);

void encode(const msp_config<1>& o, ::scale::Encoder& encoder);
void decode(msp_config<1>& o, ::scale::Decoder& decoder);

}  // namespace warden::schema
