#pragma once
#include <credo/schema/operation.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema::encoding::scale {

void encode(const add_minter<1>& o, ::scale::Encoder& encoder);
void decode(add_minter<1>& o, ::scale::Decoder& decoder);

void encode(const remove_minter<1>& o, ::scale::Encoder& encoder);
void decode(remove_minter<1>& o, ::scale::Decoder& decoder);

void encode(const set_signer<1>& o, ::scale::Encoder& encoder);
void decode(set_signer<1>& o, ::scale::Decoder& decoder);

void encode(const set_treasury<1>& o, ::scale::Encoder& encoder);
void decode(set_treasury<1>& o, ::scale::Decoder& decoder);

void encode(const set_base_uri<1>& o, ::scale::Encoder& encoder);
void decode(set_base_uri<1>& o, ::scale::Decoder& decoder);

void encode(const set_paused<1>& o, ::scale::Encoder& encoder);
void decode(set_paused<1>& o, ::scale::Decoder& decoder);

void encode(const transfer_ownership<1>& o, ::scale::Encoder& encoder);
void decode(transfer_ownership<1>& o, ::scale::Decoder& decoder);

void encode(const receive_value<1>& o, ::scale::Encoder& encoder);
void decode(receive_value<1>& o, ::scale::Decoder& decoder);

void encode(const burn<1>& o, ::scale::Encoder& encoder);
void decode(burn<1>& o, ::scale::Decoder& decoder);

void encode(const burn_batch<1>& o, ::scale::Encoder& encoder);
void decode(burn_batch<1>& o, ::scale::Decoder& decoder);

void encode(const set_approval_for_all<1>& o, ::scale::Encoder& encoder);
void decode(set_approval_for_all<1>& o, ::scale::Decoder& decoder);

void encode(const safe_transfer_from<1>& o, ::scale::Encoder& encoder);
void decode(safe_transfer_from<1>& o, ::scale::Decoder& decoder);

void encode(const safe_batch_transfer_from<1>& o, ::scale::Encoder& encoder);
void decode(safe_batch_transfer_from<1>& o, ::scale::Decoder& decoder);

void encode(const recover<1>& o, ::scale::Encoder& encoder);
void decode(recover<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema::encoding::scale
