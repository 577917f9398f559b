#pragma once
#include <credo/schema/primitives.hpp>
#include <string>

// Schema type: credential type state.
// Persisted registry row. Written once at creation and never updated.
namespace credo::schema {

template <uint16_t Version>
struct credential_type_state;

template <>
struct credential_type_state<1> final {
  uint16_t version{1};
  credential_type_id_t id{};
  std::string name;
  std::string description;
  account_id_t creator{};
  timestamp_seconds_t registered_at{};
  timestamp_seconds_t mint_start{};
  timestamp_seconds_t mint_end{};
  amount_t price{};
};

using credential_type_state_t = credential_type_state<1>;

}  // namespace credo::schema
