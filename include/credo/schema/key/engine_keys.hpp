#pragma once

#include <array>
#include <credo/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key builders for registry, ledger, access
// control and event state.
namespace credo::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kSettingsKeyPrefix{"SYS|STATE|SETTINGS|"};
inline constexpr std::string_view kNextTypeIdKeyPrefix{
    "SYS|STATE|NEXT_TYPE_ID|"};
inline constexpr std::string_view kCredentialTypeKeyPrefix{
    "SYS|STATE|CREDENTIAL_TYPE|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kSupplyKeyPrefix{"SYS|STATE|SUPPLY|"};
inline constexpr std::string_view kMinterKeyPrefix{"SYS|STATE|MINTER|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kOperatorApprovalKeyPrefix{
    "SYS|STATE|OPERATOR_APPROVAL|"};
inline constexpr std::string_view kForwardedValueKeyPrefix{
    "SYS|STATE|FORWARDED|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline constexpr std::array<std::string_view, 12> kEngineKeyspaces{
    kStatePrefix,
    kSettingsKeyPrefix,
    kNextTypeIdKeyPrefix,
    kCredentialTypeKeyPrefix,
    kBalanceKeyPrefix,
    kSupplyKeyPrefix,
    kMinterKeyPrefix,
    kNonceKeyPrefix,
    kOperatorApprovalKeyPrefix,
    kForwardedValueKeyPrefix,
    kEventSeqKeyPrefix,
    kEventPrefix};

template <typename Encoder, typename T>
credo::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                         std::string_view prefix,
                                         const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
credo::schema::bytes_t make_prefix_key(Encoder& encoder,
                                       std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
credo::schema::bytes_t make_settings_key(Encoder& encoder) {
  return make_prefix_key(encoder, kSettingsKeyPrefix);
}

template <typename Encoder>
credo::schema::bytes_t make_next_credential_type_id_key(Encoder& encoder) {
  return make_prefix_key(encoder, kNextTypeIdKeyPrefix);
}

template <typename Encoder>
credo::schema::bytes_t make_credential_type_key(
    Encoder& encoder,
    const credo::schema::credential_type_id_t id) {
  return make_prefixed_key(encoder, kCredentialTypeKeyPrefix, id);
}

template <typename Encoder>
credo::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const credo::schema::account_id_t& holder,
    const credo::schema::credential_type_id_t id) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix, std::tuple{holder, id});
}

template <typename Encoder>
credo::schema::bytes_t make_supply_key(
    Encoder& encoder,
    const credo::schema::credential_type_id_t id) {
  return make_prefixed_key(encoder, kSupplyKeyPrefix, id);
}

template <typename Encoder>
credo::schema::bytes_t make_minter_key(
    Encoder& encoder,
    const credo::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kMinterKeyPrefix, account);
}

template <typename Encoder>
credo::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const credo::schema::account_id_t& holder) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, holder);
}

template <typename Encoder>
credo::schema::bytes_t make_operator_approval_key(
    Encoder& encoder,
    const credo::schema::account_id_t& holder,
    const credo::schema::account_id_t& operator_id) {
  return make_prefixed_key(encoder, kOperatorApprovalKeyPrefix,
                           std::tuple{holder, operator_id});
}

template <typename Encoder>
credo::schema::bytes_t make_forwarded_value_key(
    Encoder& encoder,
    const credo::schema::account_id_t& treasury) {
  return make_prefixed_key(encoder, kForwardedValueKeyPrefix, treasury);
}

template <typename Encoder>
credo::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefix_key(encoder, kEventSeqKeyPrefix);
}

template <typename Encoder>
credo::schema::bytes_t make_event_key(Encoder& encoder, const uint64_t sequence) {
  return make_prefixed_key(encoder, kEventPrefix, sequence);
}

}  // namespace credo::schema::key
