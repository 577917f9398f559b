#pragma once
#include <credo/schema/event.hpp>
#include <credo/schema/event_attribute.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema::encoding::scale {

void encode(const event_attribute<1>& o, ::scale::Encoder& encoder);
void decode(event_attribute<1>& o, ::scale::Decoder& decoder);

void encode(const event<1>& o, ::scale::Encoder& encoder);
void decode(event<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema::encoding::scale
