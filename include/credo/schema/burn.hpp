#pragma once
#include <credo/schema/primitives.hpp>
#include <vector>

// Schema type: burn / burn batch.
// Destroys units held by `holder`. Callable by the holder or an approved
// operator, also while paused.
namespace credo::schema {

template <uint16_t Version>
struct burn;

template <>
struct burn<1> final {
  uint16_t version{1};
  account_id_t holder{};
  credential_type_id_t credential_type_id{};
  amount_t amount{};
};

using burn_t = burn<1>;

template <uint16_t Version>
struct burn_batch;

template <>
struct burn_batch<1> final {
  uint16_t version{1};
  account_id_t holder{};
  std::vector<credential_type_id_t> credential_type_ids;
  std::vector<amount_t> amounts;
};

using burn_batch_t = burn_batch<1>;

}  // namespace credo::schema
