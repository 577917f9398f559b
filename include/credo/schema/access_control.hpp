#pragma once
#include <credo/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema types: owner-gated administration.
namespace credo::schema {

template <uint16_t Version>
struct add_minter;

template <>
struct add_minter<1> final {
  uint16_t version{1};
  account_id_t account{};
};

using add_minter_t = add_minter<1>;

template <uint16_t Version>
struct remove_minter;

template <>
struct remove_minter<1> final {
  uint16_t version{1};
  account_id_t account{};
};

using remove_minter_t = remove_minter<1>;

// An empty signer disables the signature path until a new one is set.
template <uint16_t Version>
struct set_signer;

template <>
struct set_signer<1> final {
  uint16_t version{1};
  std::optional<signer_id_t> signer;
};

using set_signer_t = set_signer<1>;

template <uint16_t Version>
struct set_treasury;

template <>
struct set_treasury<1> final {
  uint16_t version{1};
  account_id_t treasury{};
};

using set_treasury_t = set_treasury<1>;

template <uint16_t Version>
struct set_base_uri;

template <>
struct set_base_uri<1> final {
  uint16_t version{1};
  std::string base_uri;
};

using set_base_uri_t = set_base_uri<1>;

template <uint16_t Version>
struct set_paused;

template <>
struct set_paused<1> final {
  uint16_t version{1};
  bool paused{};
};

using set_paused_t = set_paused<1>;

template <uint16_t Version>
struct transfer_ownership;

template <>
struct transfer_ownership<1> final {
  uint16_t version{1};
  account_id_t new_owner{};
};

using transfer_ownership_t = transfer_ownership<1>;

// Value sent with no other call. The amount travels in the call context.
template <uint16_t Version>
struct receive_value;

template <>
struct receive_value<1> final {
  uint16_t version{1};
};

using receive_value_t = receive_value<1>;

}  // namespace credo::schema
