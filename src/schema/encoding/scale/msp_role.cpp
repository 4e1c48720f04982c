#include <warden/schema/encoding/scale/msp_role.hpp>

namespace warden::schema {

void encode(const msp_role<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.msp_identifier, encoder);
  encode(o.role, encoder);
}

void decode(msp_role<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.msp_identifier, decoder);
  decode(o.role, decoder);
}

}  // namespace warden::schema
