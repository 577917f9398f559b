#pragma once
#include <credo/schema/primitives.hpp>
#include <string>

// Schema type: create credential type.
// Registry entry request: display metadata, the mint window and the price a
// signed claim must carry. `mint_end == 0` leaves the window open-ended.
namespace credo::schema {

template <uint16_t Version>
struct create_credential_type;

template <>
struct create_credential_type<1> final {
  uint16_t version{1};
  std::string name;
  std::string description;
  timestamp_seconds_t mint_start{};
  timestamp_seconds_t mint_end{};
  amount_t price{};
};

using create_credential_type_t = create_credential_type<1>;

}  // namespace credo::schema
