#pragma once
#include <credo/schema/authorization_mode.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/schema/recovery_authority.hpp>
#include <optional>
#include <string>

// Schema type: engine settings.
// Root configuration row. `domain_id`, `authorization_mode` and
// `recovery_authority` are fixed for the life of a deployment; the rest moves
// only through owner operations.
namespace credo::schema {

template <uint16_t Version>
struct engine_settings;

template <>
struct engine_settings<1> final {
  uint16_t version{1};
  account_id_t owner{};
  bool paused{};
  std::optional<signer_id_t> trusted_signer;
  account_id_t treasury{};
  std::string base_uri;
  domain_id_t domain_id{};
  authorization_mode_t authorization_mode{authorization_mode_t::minter_role};
  recovery_authority_t recovery_authority{recovery_authority_t::owner};
};

using engine_settings_t = engine_settings<1>;

}  // namespace credo::schema
