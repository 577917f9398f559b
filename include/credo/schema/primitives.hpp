#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace credo::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using domain_id_t = hash32_t;
using credential_type_id_t = uint64_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;

bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);
bytes_t from_base64(std::string_view encoded);

/// The all-zero account id stands for "no identity" (mint source, burn sink).
inline constexpr account_id_t kNullAccount{};

inline bool is_null(const account_id_t& account) {
  return account == kNullAccount;
}

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;
};

using named_signer_t = hash32_t;  // On chain identity reference
using signer_id_t =
    std::variant<ed25519_signer_id, secp256k1_signer_id, named_signer_t>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

/// Build a signer from its kind ("ed25519", "secp256k1" or "named") and the
/// hex public key or reference. Unknown kinds, bad hex and wrong key sizes
/// yield nullopt.
std::optional<signer_id_t> try_make_signer_id(std::string_view kind,
                                              std::string_view hex);

bool operator==(const ed25519_signer_id& lhs, const ed25519_signer_id& rhs);
bool operator==(const secp256k1_signer_id& lhs, const secp256k1_signer_id& rhs);

}  // namespace credo::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
