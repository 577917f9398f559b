#pragma once

#include <credo/schema/primitives.hpp>
#include <functional>

namespace credo::execution {

using signature_verifier_t =
    std::function<bool(const credo::schema::bytes_view_t& message,
                       const credo::schema::signer_id_t& signer,
                       const credo::schema::signature_t& signature)>;

}  // namespace credo::execution
