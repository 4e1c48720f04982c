#include <warden/schema/encoding/scale/serialized_identity.hpp>

namespace warden::schema {

void encode(const serialized_identity<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.msp_id, encoder);
  encode(o.id_bytes, encoder);
}

void decode(serialized_identity<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.msp_id, decoder);
  decode(o.id_bytes, decoder);
}

}  // namespace warden::schema
