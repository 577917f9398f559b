#pragma once
#include <credo/schema/primitives.hpp>

namespace credo::schema {

/// Host-supplied frame for one call: who is calling, the ledger time the call
/// executes at, and the value attached to it.
struct call_context_t final {
  account_id_t caller{};
  timestamp_seconds_t now{};
  amount_t value{};
};

}  // namespace credo::schema
