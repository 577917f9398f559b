#include <credo/common/critical.hpp>
#include <credo/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace credo::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<credo::schema::bytes_t> try_from_hex_internal(
    std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = credo::schema::bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::optional<credo::schema::hash32_t> try_make_hash32_internal(
    std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }

  auto hash = credo::schema::hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

std::optional<uint32_t> base64_value(const char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<uint32_t>(ch - 'A');
  }
  if (ch >= 'a' && ch <= 'z') {
    return static_cast<uint32_t>(ch - 'a' + 26);
  }
  if (ch >= '0' && ch <= '9') {
    return static_cast<uint32_t>(ch - '0' + 52);
  }
  if (ch == '+') {
    return 62u;
  }
  if (ch == '/') {
    return 63u;
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    credo::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string& bytes) {
  return make_hash32(std::string_view{bytes});
}

hash32_t make_hash32(const std::string_view& bytes) {
  auto hash = try_make_hash32_internal(bytes);
  if (!hash.has_value()) {
    credo::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string& bytes) {
  return try_make_hash32_internal(bytes);
}

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes) {
  return try_make_hash32_internal(bytes);
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  return try_from_hex_internal(hex);
}

bytes_t from_hex(std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded.has_value()) {
    credo::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  static constexpr auto kAlphabet = std::string_view{
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto accumulator = uint32_t{0};
  auto bits = 0;
  for (const auto byte : bytes) {
    accumulator = (accumulator << 8u) | byte;
    bits += 8;
    while (bits >= 6) {
      bits -= 6;
      out.push_back(kAlphabet[(accumulator >> bits) & 0x3Fu]);
    }
  }
  if (bits > 0) {
    out.push_back(kAlphabet[(accumulator << (6 - bits)) & 0x3Fu]);
  }
  while ((out.size() % 4) != 0) {
    out.push_back('=');
  }
  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

// Whitespace is ignored. Padding may only close the final quantum.
std::optional<bytes_t> try_from_base64(std::string_view encoded) {
  auto out = bytes_t{};
  out.reserve((encoded.size() / 4) * 3);

  auto accumulator = uint32_t{0};
  auto bits = 0;
  auto symbols = std::size_t{0};
  auto padding = std::size_t{0};
  for (const auto ch : encoded) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    ++symbols;
    if (ch == '=') {
      ++padding;
      continue;
    }
    auto value = base64_value(ch);
    if (!value || padding > 0) {
      return std::nullopt;
    }
    accumulator = (accumulator << 6u) | *value;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFFu));
    }
  }

  if ((symbols % 4) != 0 || padding > 2) {
    return std::nullopt;
  }
  // A pad must stand in for bits the last data symbol did not fill.
  if (padding > 0 && (symbols - padding) % 4 < 2) {
    return std::nullopt;
  }
  return out;
}

bytes_t from_base64(std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    credo::common::critical("invalid base64 input");
  }
  return *decoded;
}

hash32_t make_zero_hash() {
  return {};
}

std::optional<signer_id_t> try_make_signer_id(std::string_view kind,
                                              std::string_view hex) {
  auto bytes = try_from_hex_internal(hex);
  if (!bytes) {
    return std::nullopt;
  }
  auto copy_key = [&bytes](auto& key) {
    if (bytes->size() != key.size()) {
      return false;
    }
    std::copy(bytes->begin(), bytes->end(), key.begin());
    return true;
  };
  if (kind == "ed25519") {
    auto signer = ed25519_signer_id{};
    if (!copy_key(signer.public_key)) {
      return std::nullopt;
    }
    return signer_id_t{signer};
  }
  if (kind == "secp256k1") {
    auto signer = secp256k1_signer_id{};
    if (!copy_key(signer.public_key)) {
      return std::nullopt;
    }
    return signer_id_t{signer};
  }
  if (kind == "named") {
    auto reference = named_signer_t{};
    if (!copy_key(reference)) {
      return std::nullopt;
    }
    return signer_id_t{std::in_place_type<named_signer_t>, reference};
  }
  return std::nullopt;
}

bool operator==(const ed25519_signer_id& lhs, const ed25519_signer_id& rhs) {
  return lhs.public_key == rhs.public_key;
}

bool operator==(const secp256k1_signer_id& lhs,
                const secp256k1_signer_id& rhs) {
  return lhs.public_key == rhs.public_key;
}

}  // namespace credo::schema
