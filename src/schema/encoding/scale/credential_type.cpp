#include <credo/schema/encoding/scale/credential_type.hpp>

using namespace credo::schema;

namespace credo::schema::encoding::scale {

void encode(const create_credential_type<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.description, encoder);
  encode(o.mint_start, encoder);
  encode(o.mint_end, encoder);
  encode(o.price, encoder);
}

void decode(create_credential_type<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.description, decoder);
  decode(o.mint_start, decoder);
  decode(o.mint_end, decoder);
  decode(o.price, decoder);
}

void encode(const credential_type_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.name, encoder);
  encode(o.description, encoder);
  encode(o.creator, encoder);
  encode(o.registered_at, encoder);
  encode(o.mint_start, encoder);
  encode(o.mint_end, encoder);
  encode(o.price, encoder);
}

void decode(credential_type_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.name, decoder);
  decode(o.description, decoder);
  decode(o.creator, decoder);
  decode(o.registered_at, decoder);
  decode(o.mint_start, decoder);
  decode(o.mint_end, decoder);
  decode(o.price, decoder);
}

}  // namespace credo::schema::encoding::scale
