#pragma once

#include <credo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace credo::schema {

/// Result codes carried in `operation_result_t::code`. Values are grouped by
/// decade so the owning `error_kind` can be read off the number.
enum class error_code : uint32_t {
  ok = 0,
  caller_not_owner = 1,
  caller_not_minter = 2,
  caller_not_recovery_authority = 3,
  caller_not_holder_or_approved = 4,
  holder_approval_missing = 5,
  signer_not_configured = 6,
  invalid_signature = 7,
  signature_expired = 8,
  authorization_mode_mismatch = 9,
  paused = 10,
  not_paused = 11,
  reentrant_call = 12,
  value_forward_failed = 13,
  credential_type_not_created = 20,
  mint_not_started = 30,
  mint_ended = 31,
  invalid_mint_window = 32,
  insufficient_value = 40,
  authorization_price_below_registered = 41,
  non_transferable = 50,
  minter_already_present = 51,
  minter_absent = 52,
  credential_already_held = 53,
  invalid_identity = 54,
  insufficient_balance = 55,
  self_approval = 56,
  length_mismatch = 57,
  nothing_to_recover = 60,
  invalid_operation = 70,
};

enum class error_kind : uint8_t {
  none = 0,
  authorization = 1,
  state = 2,
  not_found = 3,
  window = 4,
  value = 5,
  invariant_violation = 6,
  empty_recovery = 7,
  malformed = 8,
};

constexpr error_kind kind_of(const error_code code) {
  switch (static_cast<uint32_t>(code) / 10) {
    case 0:
      return code == error_code::ok ? error_kind::none
                                    : error_kind::authorization;
    case 1:
      return error_kind::state;
    case 2:
      return error_kind::not_found;
    case 3:
      return error_kind::window;
    case 4:
      return error_kind::value;
    case 5:
      return error_kind::invariant_violation;
    case 6:
      return error_kind::empty_recovery;
    default:
      return error_kind::malformed;
  }
}

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"caller is not the owner",
                                            error_code::caller_not_owner},
    std::pair<std::string_view, error_code>{"caller is not a minter",
                                            error_code::caller_not_minter},
    std::pair<std::string_view, error_code>{
        "caller is not the recovery authority",
        error_code::caller_not_recovery_authority},
    std::pair<std::string_view, error_code>{
        "caller is not the holder or an approved operator",
        error_code::caller_not_holder_or_approved},
    std::pair<std::string_view, error_code>{
        "holder has not approved the recovering minter",
        error_code::holder_approval_missing},
    std::pair<std::string_view, error_code>{"no trusted signer configured",
                                            error_code::signer_not_configured},
    std::pair<std::string_view, error_code>{"invalid signature",
                                            error_code::invalid_signature},
    std::pair<std::string_view, error_code>{"signature expired",
                                            error_code::signature_expired},
    std::pair<std::string_view, error_code>{
        "mint path not enabled for this deployment",
        error_code::authorization_mode_mismatch},
    std::pair<std::string_view, error_code>{"paused", error_code::paused},
    std::pair<std::string_view, error_code>{"not paused",
                                            error_code::not_paused},
    std::pair<std::string_view, error_code>{"reentrant call",
                                            error_code::reentrant_call},
    std::pair<std::string_view, error_code>{"value forward failed",
                                            error_code::value_forward_failed},
    std::pair<std::string_view, error_code>{
        "credential type not created",
        error_code::credential_type_not_created},
    std::pair<std::string_view, error_code>{"mint not started",
                                            error_code::mint_not_started},
    std::pair<std::string_view, error_code>{"mint ended",
                                            error_code::mint_ended},
    std::pair<std::string_view, error_code>{"invalid mint window",
                                            error_code::invalid_mint_window},
    std::pair<std::string_view, error_code>{"insufficient value",
                                            error_code::insufficient_value},
    std::pair<std::string_view, error_code>{
        "authorized price below registered price",
        error_code::authorization_price_below_registered},
    std::pair<std::string_view, error_code>{"non-transferable",
                                            error_code::non_transferable},
    std::pair<std::string_view, error_code>{
        "minter already present", error_code::minter_already_present},
    std::pair<std::string_view, error_code>{"minter absent",
                                            error_code::minter_absent},
    std::pair<std::string_view, error_code>{
        "credential already held", error_code::credential_already_held},
    std::pair<std::string_view, error_code>{"invalid identity",
                                            error_code::invalid_identity},
    std::pair<std::string_view, error_code>{"insufficient balance",
                                            error_code::insufficient_balance},
    std::pair<std::string_view, error_code>{"self approval",
                                            error_code::self_approval},
    std::pair<std::string_view, error_code>{"length mismatch",
                                            error_code::length_mismatch},
    std::pair<std::string_view, error_code>{"nothing to recover",
                                            error_code::nothing_to_recover},
    std::pair<std::string_view, error_code>{"invalid operation",
                                            error_code::invalid_operation},
};

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

inline constexpr auto kErrorKindMappings = std::array{
    std::pair<std::string_view, error_kind>{"none", error_kind::none},
    std::pair<std::string_view, error_kind>{"authorization",
                                            error_kind::authorization},
    std::pair<std::string_view, error_kind>{"state", error_kind::state},
    std::pair<std::string_view, error_kind>{"not_found",
                                            error_kind::not_found},
    std::pair<std::string_view, error_kind>{"window", error_kind::window},
    std::pair<std::string_view, error_kind>{"value", error_kind::value},
    std::pair<std::string_view, error_kind>{"invariant_violation",
                                            error_kind::invariant_violation},
    std::pair<std::string_view, error_kind>{"empty_recovery",
                                            error_kind::empty_recovery},
    std::pair<std::string_view, error_kind>{"malformed",
                                            error_kind::malformed},
};

inline constexpr std::string_view to_string(const error_kind value) {
  return to_string(value, kErrorKindMappings).value_or("unknown");
}

}  // namespace credo::schema
