#pragma once
#include <credo/schema/mint_authorization.hpp>
#include <credo/schema/primitives.hpp>

// Schema type: mint with authorization.
// Signature-path issuance. Anyone may submit it; the signer's grant is what
// authorizes it.
namespace credo::schema {

template <uint16_t Version>
struct mint_with_authorization;

template <>
struct mint_with_authorization<1> final {
  uint16_t version{1};
  account_id_t to{};
  credential_type_id_t credential_type_id{};
  mint_authorization_t authorization;
};

using mint_with_authorization_t = mint_with_authorization<1>;

}  // namespace credo::schema
