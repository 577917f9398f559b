#pragma once
#include <credo/schema/primitives.hpp>

// Schema type: mint authorization.
// Off-line grant from the trusted signer. Recipient, credential type, domain
// and nonce are bound through the signed message, not carried here.
namespace credo::schema {

template <uint16_t Version>
struct mint_authorization;

template <>
struct mint_authorization<1> final {
  uint16_t version{1};
  amount_t price{};
  timestamp_seconds_t deadline{};
  signature_t signature;
};

using mint_authorization_t = mint_authorization<1>;

}  // namespace credo::schema
