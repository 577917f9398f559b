#pragma once
#include <credo/schema/primitives.hpp>

// Schema type: recover.
// Moves every positive balance of `old_holder` to `new_holder`.
namespace credo::schema {

template <uint16_t Version>
struct recover;

template <>
struct recover<1> final {
  uint16_t version{1};
  account_id_t old_holder{};
  account_id_t new_holder{};
};

using recover_t = recover<1>;

}  // namespace credo::schema
