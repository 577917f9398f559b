#pragma once

#include <credo/schema/primitives.hpp>

namespace credo::crypto {

/// True when the linked OpenSSL exposes both ed25519 and secp256k1.
bool available();

/// Check `signature` over `message` against the public key in `signer`.
///
/// ed25519 signs `message` directly; secp256k1 is ECDSA over SHA-256 of
/// `message`, given as a 65-byte compact signature with the recovery id in
/// either the first or the last byte. Named signers carry no key and never
/// verify.
bool verify_signature(const credo::schema::bytes_view_t& message,
                      const credo::schema::signer_id_t& signer,
                      const credo::schema::signature_t& signature);

}  // namespace credo::crypto
