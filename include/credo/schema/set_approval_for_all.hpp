#pragma once
#include <credo/schema/primitives.hpp>

// Schema type: set approval for all.
// Holder grants or revokes an operator for every credential type.
namespace credo::schema {

template <uint16_t Version>
struct set_approval_for_all;

template <>
struct set_approval_for_all<1> final {
  uint16_t version{1};
  account_id_t operator_id{};
  bool approved{};
};

using set_approval_for_all_t = set_approval_for_all<1>;

}  // namespace credo::schema
