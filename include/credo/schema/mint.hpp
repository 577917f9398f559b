#pragma once
#include <credo/schema/primitives.hpp>

// Schema type: mint.
// Role-path issuance of one unit to `to`.
namespace credo::schema {

template <uint16_t Version>
struct mint;

template <>
struct mint<1> final {
  uint16_t version{1};
  account_id_t to{};
  credential_type_id_t credential_type_id{};
};

using mint_t = mint<1>;

}  // namespace credo::schema
