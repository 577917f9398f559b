#pragma once
#include <credo/schema/mint.hpp>
#include <credo/schema/mint_authorization.hpp>
#include <credo/schema/mint_with_authorization.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema::encoding::scale {

void encode(const mint_authorization<1>& o, ::scale::Encoder& encoder);
void decode(mint_authorization<1>& o, ::scale::Decoder& decoder);

void encode(const mint<1>& o, ::scale::Encoder& encoder);
void decode(mint<1>& o, ::scale::Decoder& decoder);

void encode(const mint_with_authorization<1>& o, ::scale::Encoder& encoder);
void decode(mint_with_authorization<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema::encoding::scale
