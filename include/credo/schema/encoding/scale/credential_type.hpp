#pragma once
#include <credo/schema/create_credential_type.hpp>
#include <credo/schema/credential_type_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema::encoding::scale {

void encode(const create_credential_type<1>& o, ::scale::Encoder& encoder);
void decode(create_credential_type<1>& o, ::scale::Decoder& decoder);

void encode(const credential_type_state<1>& o, ::scale::Encoder& encoder);
void decode(credential_type_state<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema::encoding::scale
