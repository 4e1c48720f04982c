#include <warden/schema/encoding/scale/msp_config.hpp>

namespace warden::schema {

void encode(const key_info<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.key_identifier, encoder);
  encode(o.key_material, encoder);
}

void decode(key_info<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.key_identifier, decoder);
  decode(o.key_material, decoder);
}

void encode(const signing_identity_info<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.public_signer, encoder);
  encode(o.private_signer, encoder);
}

void decode(signing_identity_info<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.public_signer, decoder);
  decode(o.private_signer, decoder);
}

void encode(const x509_msp_config<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.root_certs, encoder);
  encode(o.intermediate_certs, encoder);
  encode(o.admins, encoder);
  encode(o.signing_identity, encoder);
}

void decode(x509_msp_config<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.root_certs, decoder);
  decode(o.intermediate_certs, decoder);
  decode(o.admins, decoder);
  decode(o.signing_identity, decoder);
}

void encode(const msp_config<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.type, encoder);
  encode(o.config, encoder);
}

void decode(msp_config<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.type, decoder);
  decode(o.config, decoder);
}

}  // namespace warden::schema
