#pragma once

#include <credo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: recovery authority.
// Identity class allowed to run recovery. The same class is the only one the
// non-transfer guard lets move balances between two non-null holders.
namespace credo::schema {

enum class recovery_authority_t : uint8_t {
  owner = 0,
  // A minter the old holder has approved as operator.
  minter_with_approval = 1
};

inline constexpr auto kRecoveryAuthorityMappings = std::array{
    std::pair<std::string_view, recovery_authority_t>{
        "owner", recovery_authority_t::owner},
    std::pair<std::string_view, recovery_authority_t>{
        "minter_with_approval", recovery_authority_t::minter_with_approval},
};

template <>
inline std::optional<recovery_authority_t> try_from_string<
    recovery_authority_t>(const std::string_view value) {
  return from_string(value, kRecoveryAuthorityMappings);
}

inline constexpr std::string_view to_string(const recovery_authority_t value) {
  return to_string(value, kRecoveryAuthorityMappings).value_or("unknown");
}

}  // namespace credo::schema
