#include <credo/schema/encoding/scale/event.hpp>

using namespace credo::schema;

namespace credo::schema::encoding::scale {

void encode(const event_attribute<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.key, encoder);
  encode(o.value, encoder);
  encode(o.index, encoder);
}

void decode(event_attribute<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.key, decoder);
  decode(o.value, decoder);
  decode(o.index, decoder);
}

void encode(const event<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.type, encoder);
  encode(o.attributes, encoder);
}

void decode(event<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.type, decoder);
  decode(o.attributes, decoder);
}

}  // namespace credo::schema::encoding::scale
