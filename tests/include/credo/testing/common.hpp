#pragma once

#include <credo/schema/call_context.hpp>
#include <credo/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace credo::testing {

inline credo::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = credo::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline credo::schema::account_id_t make_account(const uint8_t seed) {
  return make_hash(seed);
}

inline const credo::schema::account_id_t kOwner = make_account(0x01);
inline const credo::schema::account_id_t kTreasury = make_account(0x02);
inline const credo::schema::account_id_t kMinter = make_account(0x03);
inline const credo::schema::account_id_t kAlice = make_account(0x10);
inline const credo::schema::account_id_t kBob = make_account(0x20);
inline const credo::schema::account_id_t kCarol = make_account(0x30);
inline const credo::schema::domain_id_t kDomain = make_hash(0xD0);

inline credo::schema::call_context_t make_call(
    const credo::schema::account_id_t& caller,
    const credo::schema::timestamp_seconds_t now = 1'000,
    const credo::schema::amount_t& value = credo::schema::amount_t{0}) {
  return credo::schema::call_context_t{
      .caller = caller, .now = now, .value = value};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace credo::testing
