#pragma once
#include <credo/schema/authorization_mode.hpp>
#include <credo/schema/engine_settings.hpp>
#include <credo/schema/recovery_authority.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema::encoding::scale {

void encode(const authorization_mode_t& o, ::scale::Encoder& encoder);
void decode(authorization_mode_t& o, ::scale::Decoder& decoder);

void encode(const recovery_authority_t& o, ::scale::Encoder& encoder);
void decode(recovery_authority_t& o, ::scale::Decoder& decoder);

void encode(const engine_settings<1>& o, ::scale::Encoder& encoder);
void decode(engine_settings<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema::encoding::scale
