#pragma once
#include <credo/schema/access_control.hpp>
#include <credo/schema/burn.hpp>
#include <credo/schema/create_credential_type.hpp>
#include <credo/schema/mint.hpp>
#include <credo/schema/mint_with_authorization.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/schema/recover.hpp>
#include <credo/schema/safe_transfer_from.hpp>
#include <credo/schema/set_approval_for_all.hpp>
#include <variant>

namespace credo::schema {

using operation_t = std::variant<create_credential_type_t,
                                 add_minter_t,
                                 remove_minter_t,
                                 set_signer_t,
                                 set_treasury_t,
                                 set_base_uri_t,
                                 set_paused_t,
                                 transfer_ownership_t,
                                 mint_t,
                                 mint_with_authorization_t,
                                 burn_t,
                                 burn_batch_t,
                                 set_approval_for_all_t,
                                 safe_transfer_from_t,
                                 safe_batch_transfer_from_t,
                                 recover_t,
                                 receive_value_t>;

}  // namespace credo::schema
