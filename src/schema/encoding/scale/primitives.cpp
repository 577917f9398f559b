#include <credo/schema/encoding/scale/primitives.hpp>

using namespace credo::schema;

namespace credo::schema::encoding::scale {

void encode(const ed25519_signer_id& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(ed25519_signer_id& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

void encode(const secp256k1_signer_id& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(secp256k1_signer_id& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

}  // namespace credo::schema::encoding::scale
