#include <credo/schema/encoding/scale/mint_authorization.hpp>
#include <credo/schema/encoding/scale/primitives.hpp>

using namespace credo::schema;

namespace credo::schema::encoding::scale {

void encode(const mint_authorization<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.price, encoder);
  encode(o.deadline, encoder);
  encode(o.signature, encoder);
}

void decode(mint_authorization<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.price, decoder);
  decode(o.deadline, decoder);
  decode(o.signature, decoder);
}

void encode(const mint<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.to, encoder);
  encode(o.credential_type_id, encoder);
}

void decode(mint<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.to, decoder);
  decode(o.credential_type_id, decoder);
}

void encode(const mint_with_authorization<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.to, encoder);
  encode(o.credential_type_id, encoder);
  encode(o.authorization, encoder);
}

void decode(mint_with_authorization<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.to, decoder);
  decode(o.credential_type_id, decoder);
  decode(o.authorization, decoder);
}

}  // namespace credo::schema::encoding::scale
