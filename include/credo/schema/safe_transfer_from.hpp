#pragma once
#include <credo/schema/primitives.hpp>
#include <vector>

// Schema type: safe transfer from / safe batch transfer from.
// Holder-to-holder moves. Rejected as non-transferable unless issued by the
// recovery authority.
namespace credo::schema {

template <uint16_t Version>
struct safe_transfer_from;

template <>
struct safe_transfer_from<1> final {
  uint16_t version{1};
  account_id_t from{};
  account_id_t to{};
  credential_type_id_t credential_type_id{};
  amount_t amount{};
};

using safe_transfer_from_t = safe_transfer_from<1>;

template <uint16_t Version>
struct safe_batch_transfer_from;

template <>
struct safe_batch_transfer_from<1> final {
  uint16_t version{1};
  account_id_t from{};
  account_id_t to{};
  std::vector<credential_type_id_t> credential_type_ids;
  std::vector<amount_t> amounts;
};

using safe_batch_transfer_from_t = safe_batch_transfer_from<1>;

}  // namespace credo::schema
