#include <credo/schema/encoding/scale/engine_settings.hpp>
#include <credo/schema/encoding/scale/primitives.hpp>

using namespace credo::schema;

namespace credo::schema::encoding::scale {

void encode(const authorization_mode_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(authorization_mode_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  o = static_cast<authorization_mode_t>(raw);
}

void encode(const recovery_authority_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(recovery_authority_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  o = static_cast<recovery_authority_t>(raw);
}

void encode(const engine_settings<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.paused, encoder);
  encode(o.trusted_signer, encoder);
  encode(o.treasury, encoder);
  encode(o.base_uri, encoder);
  encode(o.domain_id, encoder);
  encode(o.authorization_mode, encoder);
  encode(o.recovery_authority, encoder);
}

void decode(engine_settings<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.paused, decoder);
  decode(o.trusted_signer, decoder);
  decode(o.treasury, decoder);
  decode(o.base_uri, decoder);
  decode(o.domain_id, decoder);
  decode(o.authorization_mode, decoder);
  decode(o.recovery_authority, decoder);
}

}  // namespace credo::schema::encoding::scale
