#include <warden/schema/encoding/scale/msp_principal.hpp>

namespace warden::schema {

void encode(const msp_principal<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.classification, encoder);
  encode(o.principal, encoder);
}

void decode(msp_principal<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.classification, decoder);
  decode(o.principal, decoder);
}

}  // namespace warden::schema
