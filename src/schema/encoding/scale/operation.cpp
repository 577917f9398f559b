#include <credo/schema/encoding/scale/operation.hpp>
#include <credo/schema/encoding/scale/primitives.hpp>

using namespace credo::schema;

namespace credo::schema::encoding::scale {

void encode(const add_minter<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account, encoder);
}

void decode(add_minter<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account, decoder);
}

void encode(const remove_minter<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account, encoder);
}

void decode(remove_minter<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account, decoder);
}

void encode(const set_signer<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.signer, encoder);
}

void decode(set_signer<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.signer, decoder);
}

void encode(const set_treasury<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.treasury, encoder);
}

void decode(set_treasury<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.treasury, decoder);
}

void encode(const set_base_uri<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.base_uri, encoder);
}

void decode(set_base_uri<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.base_uri, decoder);
}

void encode(const set_paused<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.paused, encoder);
}

void decode(set_paused<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.paused, decoder);
}

void encode(const transfer_ownership<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.new_owner, encoder);
}

void decode(transfer_ownership<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.new_owner, decoder);
}

void encode(const receive_value<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(receive_value<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const burn<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.holder, encoder);
  encode(o.credential_type_id, encoder);
  encode(o.amount, encoder);
}

void decode(burn<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.holder, decoder);
  decode(o.credential_type_id, decoder);
  decode(o.amount, decoder);
}

void encode(const burn_batch<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.holder, encoder);
  encode(o.credential_type_ids, encoder);
  encode(o.amounts, encoder);
}

void decode(burn_batch<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.holder, decoder);
  decode(o.credential_type_ids, decoder);
  decode(o.amounts, decoder);
}

void encode(const set_approval_for_all<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.operator_id, encoder);
  encode(o.approved, encoder);
}

void decode(set_approval_for_all<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.operator_id, decoder);
  decode(o.approved, decoder);
}

void encode(const safe_transfer_from<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.from, encoder);
  encode(o.to, encoder);
  encode(o.credential_type_id, encoder);
  encode(o.amount, encoder);
}

void decode(safe_transfer_from<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.from, decoder);
  decode(o.to, decoder);
  decode(o.credential_type_id, decoder);
  decode(o.amount, decoder);
}

void encode(const safe_batch_transfer_from<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.from, encoder);
  encode(o.to, encoder);
  encode(o.credential_type_ids, encoder);
  encode(o.amounts, encoder);
}

void decode(safe_batch_transfer_from<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.from, decoder);
  decode(o.to, decoder);
  decode(o.credential_type_ids, decoder);
  decode(o.amounts, decoder);
}

void encode(const recover<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.old_holder, encoder);
  encode(o.new_holder, encoder);
}

void decode(recover<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.old_holder, decoder);
  decode(o.new_holder, decoder);
}

}  // namespace credo::schema::encoding::scale
