#pragma once

#include <credo/schema/primitives.hpp>
#include <functional>

namespace credo::execution {

/// Receives value forwarded to the treasury after a call's state is committed.
/// Returning false or throwing refuses the transfer and reverts the call.
using value_sink_t =
    std::function<bool(const credo::schema::account_id_t& treasury,
                       const credo::schema::amount_t& value)>;

}  // namespace credo::execution
