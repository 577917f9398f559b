#include <credo/authorization/mint_message.hpp>
#include <credo/blake3/hash.hpp>
#include <credo/schema/encoding/scale/encoder.hpp>
#include <tuple>

namespace credo::authorization {

namespace {

using encoder_t = credo::schema::encoding::encoder<
    credo::schema::encoding::scale_encoder_tag>;

}  // namespace

credo::schema::bytes_t make_mint_authorization_message(
    const mint_claim_t& claim) {
  auto message = credo::schema::make_bytes(kMintAuthorizationTag);
  auto encoder = encoder_t{};
  encoder.encode(std::tuple{claim.recipient, claim.credential_type_id,
                            claim.price, claim.deadline, claim.domain_id,
                            claim.nonce},
                 message);
  return message;
}

credo::schema::hash32_t mint_authorization_digest(const mint_claim_t& claim) {
  auto message = make_mint_authorization_message(claim);
  return credo::blake3::hash(
      credo::schema::bytes_view_t{message.data(), message.size()});
}

}  // namespace credo::authorization
