#pragma once

#include <credo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: authorization mode.
// Which issuance path a deployment accepts. Exactly one is active; the other
// mint entry point is rejected.
namespace credo::schema {

enum class authorization_mode_t : uint8_t {
  minter_role = 0,
  trusted_signature = 1
};

inline constexpr auto kAuthorizationModeMappings = std::array{
    std::pair<std::string_view, authorization_mode_t>{
        "minter_role", authorization_mode_t::minter_role},
    std::pair<std::string_view, authorization_mode_t>{
        "trusted_signature", authorization_mode_t::trusted_signature},
};

template <>
inline std::optional<authorization_mode_t> try_from_string<
    authorization_mode_t>(const std::string_view value) {
  return from_string(value, kAuthorizationModeMappings);
}

inline constexpr std::string_view to_string(const authorization_mode_t value) {
  return to_string(value, kAuthorizationModeMappings).value_or("unknown");
}

}  // namespace credo::schema
