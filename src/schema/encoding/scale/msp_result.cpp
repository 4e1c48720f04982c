#include <warden/schema/encoding/scale/msp_result.hpp>

namespace warden::schema {

void encode(const msp_result<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.code, encoder);
  encode(o.log, encoder);
  encode(o.info, encoder);
  encode(o.codespace, encoder);
}

void decode(msp_result<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.code, decoder);
  decode(o.log, decoder);
  decode(o.info, decoder);
  decode(o.codespace, decoder);
}

}  // namespace warden::schema
