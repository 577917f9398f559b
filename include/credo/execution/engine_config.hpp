#pragma once

#include <credo/schema/authorization_mode.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/schema/recovery_authority.hpp>
#include <optional>
#include <string>

namespace credo::execution {

/// Deployment settings used the first time an engine opens an empty store.
/// A store that already holds settings keeps its own.
struct engine_config_t final {
  credo::schema::domain_id_t domain_id{};
  credo::schema::account_id_t owner{};
  credo::schema::account_id_t treasury{};
  std::optional<credo::schema::signer_id_t> trusted_signer;
  std::string base_uri;
  credo::schema::authorization_mode_t authorization_mode{
      credo::schema::authorization_mode_t::minter_role};
  credo::schema::recovery_authority_t recovery_authority{
      credo::schema::recovery_authority_t::owner};
};

}  // namespace credo::execution
