#pragma once
#include <credo/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

namespace credo::authorization {

inline constexpr std::string_view kMintAuthorizationTag{
    "credo.mint_authorization.v1"};

/// Fields a trusted signer commits to when granting one mint.
struct mint_claim_t final {
  credo::schema::account_id_t recipient{};
  credo::schema::credential_type_id_t credential_type_id{};
  credo::schema::amount_t price{};
  credo::schema::timestamp_seconds_t deadline{};
  credo::schema::domain_id_t domain_id{};
  uint64_t nonce{};
};

/// ASCII tag followed by the SCALE encoding of the claim fields in
/// declaration order.
credo::schema::bytes_t make_mint_authorization_message(
    const mint_claim_t& claim);

/// BLAKE3-256 of `make_mint_authorization_message`. This is the byte string
/// the signer signs.
credo::schema::hash32_t mint_authorization_digest(const mint_claim_t& claim);

}  // namespace credo::authorization
