#pragma once
#include <blake3.h>
#include <credo/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace credo::blake3 {

/// Incremental BLAKE3-256. Owns the C hasher state.
class hasher final {
 public:
  hasher();
  hasher(const hasher&) = delete;
  hasher& operator=(const hasher&) = delete;

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);
  credo::schema::hash32_t finalize() const;

 private:
  ::blake3_hasher state_{};
};

credo::schema::hash32_t hash(const std::string_view& str);
credo::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace credo::blake3
