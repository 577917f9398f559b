#include <spdlog/spdlog.h>
#include <credo/authorization/mint_message.hpp>
#include <credo/common/critical.hpp>
#include <credo/crypto/verify.hpp>
#include <credo/execution/engine.hpp>
#include <credo/ledger/balance_ledger.hpp>
#include <credo/schema/key/engine_keys.hpp>
#include <credo/storage/state_transaction.hpp>
#include <exception>
#include <utility>

using namespace credo::schema;

namespace {

using encoder_t = credo::schema::encoding::encoder<
    credo::schema::encoding::scale_encoder_tag>;
using transaction_t =
    credo::storage::state_transaction<credo::storage::rocksdb_storage_tag>;

constexpr auto kCodespace = std::string_view{"credo.execute"};

std::string account_hex(const account_id_t& account) {
  return to_hex(bytes_view_t{account.data(), account.size()});
}

std::string signer_hex(const signer_id_t& signer) {
  return std::visit(
      overloaded{[](const ed25519_signer_id& arg) {
                   return "ed25519:" + to_hex(bytes_view_t{
                                           arg.public_key.data(),
                                           arg.public_key.size()});
                 },
                 [](const secp256k1_signer_id& arg) {
                   return "secp256k1:" + to_hex(bytes_view_t{
                                             arg.public_key.data(),
                                             arg.public_key.size()});
                 },
                 [](const named_signer_t& arg) {
                   return "named:" +
                          to_hex(bytes_view_t{arg.data(), arg.size()});
                 }},
      signer);
}

std::string join_ids(const std::vector<credential_type_id_t>& ids) {
  auto out = std::string{};
  for (const auto id : ids) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out.append(std::to_string(id));
  }
  return out;
}

std::string join_amounts(const std::vector<amount_t>& amounts) {
  auto out = std::string{};
  for (const auto& amount : amounts) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out.append(amount.str());
  }
  return out;
}

event_attribute_t make_attribute(std::string key,
                                 std::string value,
                                 bool index = true) {
  return event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

event_t make_event(std::string type,
                   std::vector<event_attribute_t> attributes) {
  return event_t{.type = std::move(type), .attributes = std::move(attributes)};
}

operation_result_t make_result(const error_code code, std::string info) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{kCodespace};
  return result;
}

engine_settings_t load_settings(encoder_t& encoder,
                                const transaction_t& transaction) {
  auto settings = transaction.get<engine_settings_t>(
      encoder, key::make_settings_key(encoder));
  if (!settings) {
    credo::common::critical("engine settings missing from storage");
  }
  return *settings;
}

bool minter_present(encoder_t& encoder,
                    const transaction_t& transaction,
                    const account_id_t& account) {
  return transaction.get<bool>(encoder, key::make_minter_key(encoder, account))
      .value_or(false);
}

credential_type_id_t load_next_credential_type_id(
    encoder_t& encoder,
    const transaction_t& transaction) {
  return transaction
      .get<credential_type_id_t>(
          encoder, key::make_next_credential_type_id_key(encoder))
      .value_or(0);
}

std::optional<credential_type_state_t> load_credential_type(
    encoder_t& encoder,
    const transaction_t& transaction,
    const credential_type_id_t id) {
  return transaction.get<credential_type_state_t>(
      encoder, key::make_credential_type_key(encoder, id));
}

uint64_t load_nonce(encoder_t& encoder,
                    const transaction_t& transaction,
                    const account_id_t& holder) {
  return transaction.get<uint64_t>(encoder, key::make_nonce_key(encoder, holder))
      .value_or(0);
}

// Shared mint gate: pause, registry, then the type's window.
error_code check_issuance_window(
    const engine_settings_t& settings,
    const std::optional<credential_type_state_t>& type,
    const timestamp_seconds_t now) {
  if (settings.paused) {
    return error_code::paused;
  }
  if (!type) {
    return error_code::credential_type_not_created;
  }
  if (now < type->mint_start) {
    return error_code::mint_not_started;
  }
  if (type->mint_end != 0 && now >= type->mint_end) {
    return error_code::mint_ended;
  }
  return error_code::ok;
}

event_t make_issued_event(const account_id_t& to,
                          const credential_type_id_t id,
                          const amount_t& value) {
  return make_event("credential_issued",
                    {make_attribute("to", account_hex(to)),
                     make_attribute("credential_type_id", std::to_string(id)),
                     make_attribute("value", value.str(), false)});
}

// Marks the engine busy for the lifetime of one mutating call.
class execution_scope final {
 public:
  explicit execution_scope(bool& executing) : executing_{executing} {
    executing_ = true;
  }
  ~execution_scope() { executing_ = false; }

  execution_scope(const execution_scope&) = delete;
  execution_scope& operator=(const execution_scope&) = delete;

 private:
  bool& executing_;
};

}  // namespace

namespace credo::execution {

struct engine::call_frame final {
  call_frame(encoder_t& encoder_ref,
             const call_context_t& context_ref,
             transaction_t& transaction_ref,
             engine_settings_t loaded_settings)
      : encoder{encoder_ref},
        context{context_ref},
        transaction{transaction_ref},
        settings{std::move(loaded_settings)},
        ledger{encoder_ref, transaction_ref,
               [this](const account_id_t& operator_id,
                      const account_id_t& from) {
                 return check_recovery_authority(operator_id, from) ==
                        error_code::ok;
               }},
        forward_value{context_ref.value} {}

  call_frame(const call_frame&) = delete;
  call_frame& operator=(const call_frame&) = delete;

  error_code check_owner() const {
    return context.caller == settings.owner ? error_code::ok
                                            : error_code::caller_not_owner;
  }

  error_code check_recovery_authority(const account_id_t& caller,
                                      const account_id_t& holder) const {
    switch (settings.recovery_authority) {
      case recovery_authority_t::owner:
        return caller == settings.owner
                   ? error_code::ok
                   : error_code::caller_not_recovery_authority;
      case recovery_authority_t::minter_with_approval:
        if (!minter_present(encoder, transaction, caller)) {
          return error_code::caller_not_recovery_authority;
        }
        return ledger.is_approved_for_all(holder, caller)
                   ? error_code::ok
                   : error_code::holder_approval_missing;
    }
    return error_code::caller_not_recovery_authority;
  }

  void save_settings() {
    transaction.put(encoder, key::make_settings_key(encoder), settings);
  }

  encoder_t& encoder;
  const call_context_t& context;
  transaction_t& transaction;
  engine_settings_t settings;
  credo::ledger::balance_ledger ledger;
  amount_t forward_value{};
  std::vector<event_t> events;
  bytes_t data;
  std::string info;
};

engine::engine(encoder_t& encoder,
               credo::storage::storage<credo::storage::rocksdb_storage_tag>&
                   storage,
               const engine_config_t& config)
    : encoder_{encoder},
      storage_{storage},
      signature_verifier_{credo::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  load_or_initialize_settings(config);
}

void engine::load_or_initialize_settings(const engine_config_t& config) {
  auto settings_key = key::make_settings_key(encoder_);
  auto persisted = storage_.get<engine_settings_t>(encoder_, settings_key);
  if (persisted) {
    if (persisted->domain_id != config.domain_id) {
      spdlog::warn("Store is bound to domain {}; ignoring configured domain",
                   to_hex(bytes_view_t{persisted->domain_id.data(),
                                       persisted->domain_id.size()}));
    }
    if (persisted->authorization_mode != config.authorization_mode ||
        persisted->recovery_authority != config.recovery_authority) {
      spdlog::warn(
          "Store uses authorization mode '{}' and recovery authority '{}'; "
          "ignoring configured values",
          to_string(persisted->authorization_mode),
          to_string(persisted->recovery_authority));
    }
    auto transaction = transaction_t{storage_};
    spdlog::info("Resumed credo engine owned by {} with {} credential type(s)",
                 account_hex(persisted->owner),
                 load_next_credential_type_id(encoder_, transaction));
    return;
  }

  if (is_null(config.owner)) {
    credo::common::critical("engine owner must not be the null account");
  }
  if (is_null(config.treasury)) {
    credo::common::critical("engine treasury must not be the null account");
  }
  if (is_null(config.domain_id)) {
    credo::common::critical("engine domain id must not be all zero");
  }

  auto settings = engine_settings_t{};
  settings.owner = config.owner;
  settings.paused = false;
  settings.trusted_signer = config.trusted_signer;
  settings.treasury = config.treasury;
  settings.base_uri = config.base_uri;
  settings.domain_id = config.domain_id;
  settings.authorization_mode = config.authorization_mode;
  settings.recovery_authority = config.recovery_authority;
  storage_.put(encoder_, settings_key, settings);
  spdlog::info(
      "Initialized credo engine owned by {} (mode '{}', recovery '{}')",
      account_hex(settings.owner), to_string(settings.authorization_mode),
      to_string(settings.recovery_authority));
}

operation_result_t engine::run(const call_context_t& context,
                               const std::string_view operation_name,
                               const call_body_t& body) {
  auto lock = std::scoped_lock{mutex_};
  if (executing_) {
    spdlog::warn("Rejected reentrant {} from {}", operation_name,
                 account_hex(context.caller));
    return make_result(error_code::reentrant_call,
                       std::string{operation_name} +
                           " issued while another call is executing");
  }
  auto scope = execution_scope{executing_};

  auto transaction = transaction_t{storage_};
  auto frame = call_frame{encoder_, context, transaction,
                          load_settings(encoder_, transaction)};
  auto code = body(frame);
  if (code != error_code::ok) {
    spdlog::debug("{} from {} rejected: {}", operation_name,
                  account_hex(context.caller), to_string(code));
    return make_result(code, std::move(frame.info));
  }

  if (!frame.events.empty()) {
    auto sequence_key = key::make_event_sequence_key(encoder_);
    auto next_sequence =
        transaction.get<uint64_t>(encoder_, sequence_key).value_or(0);
    for (auto& event : frame.events) {
      event.sequence = next_sequence++;
      transaction.put(encoder_, key::make_event_key(encoder_, event.sequence),
                      event);
    }
    transaction.put(encoder_, sequence_key, next_sequence);
  }

  const auto forward_value = frame.forward_value;
  const auto treasury = frame.settings.treasury;
  if (forward_value > 0) {
    auto forwarded_key = key::make_forwarded_value_key(encoder_, treasury);
    auto total = transaction.get<amount_t>(encoder_, forwarded_key)
                     .value_or(amount_t{0});
    transaction.put(encoder_, forwarded_key, amount_t{total + forward_value});
  }

  transaction.commit();

  if (forward_value > 0 && value_sink_) {
    auto accepted = false;
    auto failure = std::string{"treasury refused " + forward_value.str()};
    try {
      accepted = value_sink_(treasury, forward_value);
    } catch (const std::exception& ex) {
      failure = "treasury sink failed: " + std::string{ex.what()};
    }
    if (!accepted) {
      transaction.rollback();
      spdlog::warn("Forwarding {} to treasury {} for {} failed ({}); reverted",
                   forward_value.str(), account_hex(treasury), operation_name,
                   failure);
      return make_result(error_code::value_forward_failed, std::move(failure));
    }
  }

  spdlog::debug("{} from {} committed with {} event(s)", operation_name,
                account_hex(context.caller), frame.events.size());
  auto result = make_result(error_code::ok, std::move(frame.info));
  result.data = std::move(frame.data);
  result.events = std::move(frame.events);
  return result;
}

operation_result_t engine::execute(const call_context_t& context,
                                   const operation_t& operation) {
  auto version = std::visit([](const auto& arg) { return arg.version; },
                            operation);
  if (version != 1) {
    return make_result(error_code::invalid_operation,
                       "unsupported operation version " +
                           std::to_string(version));
  }
  return std::visit(
      overloaded{
          [&](const create_credential_type_t& arg) {
            return create_credential_type(context, arg);
          },
          [&](const add_minter_t& arg) { return add_minter(context, arg); },
          [&](const remove_minter_t& arg) {
            return remove_minter(context, arg);
          },
          [&](const set_signer_t& arg) { return set_signer(context, arg); },
          [&](const set_treasury_t& arg) {
            return set_treasury(context, arg);
          },
          [&](const set_base_uri_t& arg) {
            return set_base_uri(context, arg);
          },
          [&](const set_paused_t& arg) { return set_paused(context, arg); },
          [&](const transfer_ownership_t& arg) {
            return transfer_ownership(context, arg);
          },
          [&](const mint_t& arg) { return mint(context, arg); },
          [&](const mint_with_authorization_t& arg) {
            return mint_with_authorization(context, arg);
          },
          [&](const burn_t& arg) { return burn(context, arg); },
          [&](const burn_batch_t& arg) { return burn_batch(context, arg); },
          [&](const set_approval_for_all_t& arg) {
            return set_approval_for_all(context, arg);
          },
          [&](const safe_transfer_from_t& arg) {
            return safe_transfer_from(context, arg);
          },
          [&](const safe_batch_transfer_from_t& arg) {
            return safe_batch_transfer_from(context, arg);
          },
          [&](const recover_t& arg) { return recover(context, arg); },
          [&](const receive_value_t&) { return receive(context); }},
      operation);
}

operation_result_t engine::execute_encoded(const call_context_t& context,
                                           const bytes_view_t& raw_operation) {
  if (raw_operation.empty()) {
    return make_result(error_code::invalid_operation, "empty operation");
  }
  auto operation = std::optional<operation_t>{};
  try {
    operation = encoder_.try_decode<operation_t>(raw_operation);
  } catch (const std::exception& ex) {
    spdlog::debug("Operation decode threw: {}", ex.what());
  }
  if (!operation) {
    return make_result(error_code::invalid_operation,
                       "failed to decode operation");
  }
  return execute(context, *operation);
}

operation_result_t engine::create_credential_type(
    const call_context_t& context,
    const create_credential_type_t& operation) {
  return run(context, "create_credential_type", [&](call_frame& frame) {
    if (auto code = frame.check_owner(); code != error_code::ok) {
      return code;
    }
    if (frame.settings.paused) {
      return error_code::paused;
    }
    if (operation.mint_end != 0 && operation.mint_end <= operation.mint_start) {
      frame.info = "mint window end " + std::to_string(operation.mint_end) +
                   " is not after start " +
                   std::to_string(operation.mint_start);
      return error_code::invalid_mint_window;
    }

    auto next_id_key = key::make_next_credential_type_id_key(encoder_);
    auto id = load_next_credential_type_id(encoder_, frame.transaction);
    auto state = credential_type_state_t{.id = id,
                                         .name = operation.name,
                                         .description = operation.description,
                                         .creator = context.caller,
                                         .registered_at = context.now,
                                         .mint_start = operation.mint_start,
                                         .mint_end = operation.mint_end,
                                         .price = operation.price};
    frame.transaction.put(encoder_, key::make_credential_type_key(encoder_, id),
                          state);
    frame.transaction.put(encoder_, next_id_key, credential_type_id_t{id + 1});

    frame.events.push_back(make_event(
        "credential_type_created",
        {make_attribute("credential_type_id", std::to_string(id)),
         make_attribute("name", operation.name, false),
         make_attribute("creator", account_hex(context.caller)),
         make_attribute("mint_start", std::to_string(operation.mint_start),
                        false),
         make_attribute("mint_end", std::to_string(operation.mint_end), false),
         make_attribute("price", operation.price.str(), false)}));
    frame.data = encoder_.encode(id);
    frame.info = "credential type " + std::to_string(id) + " created";
    return error_code::ok;
  });
}

operation_result_t engine::add_minter(const call_context_t& context,
                                      const add_minter_t& operation) {
  return run(context, "add_minter", [&](call_frame& frame) {
    if (auto code = frame.check_owner(); code != error_code::ok) {
      return code;
    }
    if (frame.settings.paused) {
      return error_code::paused;
    }
    if (is_null(operation.account)) {
      return error_code::invalid_identity;
    }
    if (minter_present(encoder_, frame.transaction, operation.account)) {
      return error_code::minter_already_present;
    }
    frame.transaction.put(encoder_,
                          key::make_minter_key(encoder_, operation.account),
                          true);
    frame.events.push_back(make_event(
        "minter_added", {make_attribute("account", account_hex(operation.account))}));
    return error_code::ok;
  });
}

operation_result_t engine::remove_minter(const call_context_t& context,
                                         const remove_minter_t& operation) {
  return run(context, "remove_minter", [&](call_frame& frame) {
    if (auto code = frame.check_owner(); code != error_code::ok) {
      return code;
    }
    if (frame.settings.paused) {
      return error_code::paused;
    }
    if (!minter_present(encoder_, frame.transaction, operation.account)) {
      return error_code::minter_absent;
    }
    frame.transaction.erase(key::make_minter_key(encoder_, operation.account));
    frame.events.push_back(make_event(
        "minter_removed",
        {make_attribute("account", account_hex(operation.account))}));
    return error_code::ok;
  });
}

operation_result_t engine::set_signer(const call_context_t& context,
                                      const set_signer_t& operation) {
  return run(context, "set_signer", [&](call_frame& frame) {
    if (auto code = frame.check_owner(); code != error_code::ok) {
      return code;
    }
    frame.settings.trusted_signer = operation.signer;
    frame.save_settings();
    frame.events.push_back(make_event(
        "signer_updated",
        {make_attribute("signer", operation.signer
                                      ? signer_hex(*operation.signer)
                                      : std::string{"none"})}));
    return error_code::ok;
  });
}

operation_result_t engine::set_treasury(const call_context_t& context,
                                        const set_treasury_t& operation) {
  return run(context, "set_treasury", [&](call_frame& frame) {
    if (auto code = frame.check_owner(); code != error_code::ok) {
      return code;
    }
    if (frame.settings.paused) {
      return error_code::paused;
    }
    if (is_null(operation.treasury)) {
      return error_code::invalid_identity;
    }
    auto previous = frame.settings.treasury;
    frame.settings.treasury = operation.treasury;
    frame.save_settings();
    frame.events.push_back(make_event(
        "treasury_updated",
        {make_attribute("previous_treasury", account_hex(previous)),
         make_attribute("treasury", account_hex(operation.treasury))}));
    return error_code::ok;
  });
}

operation_result_t engine::set_base_uri(const call_context_t& context,
                                        const set_base_uri_t& operation) {
  return run(context, "set_base_uri", [&](call_frame& frame) {
    if (auto code = frame.check_owner(); code != error_code::ok) {
      return code;
    }
    if (frame.settings.paused) {
      return error_code::paused;
    }
    frame.settings.base_uri = operation.base_uri;
    frame.save_settings();
    frame.events.push_back(make_event(
        "base_uri_updated",
        {make_attribute("base_uri", operation.base_uri, false)}));
    return error_code::ok;
  });
}

operation_result_t engine::set_paused(const call_context_t& context,
                                      const set_paused_t& operation) {
  return run(context, "set_paused", [&](call_frame& frame) {
    if (auto code = frame.check_owner(); code != error_code::ok) {
      return code;
    }
    if (operation.paused && frame.settings.paused) {
      return error_code::paused;
    }
    if (!operation.paused && !frame.settings.paused) {
      return error_code::not_paused;
    }
    frame.settings.paused = operation.paused;
    frame.save_settings();
    frame.events.push_back(
        make_event(operation.paused ? "paused" : "unpaused",
                   {make_attribute("account", account_hex(context.caller))}));
    return error_code::ok;
  });
}

operation_result_t engine::pause(const call_context_t& context) {
  return set_paused(context, set_paused_t{.paused = true});
}

operation_result_t engine::unpause(const call_context_t& context) {
  return set_paused(context, set_paused_t{.paused = false});
}

operation_result_t engine::transfer_ownership(
    const call_context_t& context,
    const transfer_ownership_t& operation) {
  return run(context, "transfer_ownership", [&](call_frame& frame) {
    if (auto code = frame.check_owner(); code != error_code::ok) {
      return code;
    }
    if (is_null(operation.new_owner)) {
      return error_code::invalid_identity;
    }
    auto previous = frame.settings.owner;
    frame.settings.owner = operation.new_owner;
    frame.save_settings();
    frame.events.push_back(make_event(
        "ownership_transferred",
        {make_attribute("previous_owner", account_hex(previous)),
         make_attribute("new_owner", account_hex(operation.new_owner))}));
    return error_code::ok;
  });
}

operation_result_t engine::mint(const call_context_t& context,
                                const mint_t& operation) {
  return run(context, "mint", [&](call_frame& frame) {
    const auto id = operation.credential_type_id;
    auto type = load_credential_type(encoder_, frame.transaction, id);
    if (auto code = check_issuance_window(frame.settings, type, context.now);
        code != error_code::ok) {
      return code;
    }
    if (frame.settings.authorization_mode !=
        authorization_mode_t::minter_role) {
      return error_code::authorization_mode_mismatch;
    }
    if (!minter_present(encoder_, frame.transaction, context.caller)) {
      return error_code::caller_not_minter;
    }
    if (is_null(operation.to)) {
      return error_code::invalid_identity;
    }
    if (auto code =
            frame.ledger.mint(context.caller, operation.to, id, amount_t{1});
        code != error_code::ok) {
      return code;
    }
    frame.events.push_back(make_issued_event(operation.to, id, context.value));
    return error_code::ok;
  });
}

operation_result_t engine::mint_with_authorization(
    const call_context_t& context,
    const mint_with_authorization_t& operation) {
  return run(context, "mint_with_authorization", [&](call_frame& frame) {
    const auto id = operation.credential_type_id;
    const auto& grant = operation.authorization;
    auto type = load_credential_type(encoder_, frame.transaction, id);
    if (auto code = check_issuance_window(frame.settings, type, context.now);
        code != error_code::ok) {
      return code;
    }
    if (frame.settings.authorization_mode !=
        authorization_mode_t::trusted_signature) {
      return error_code::authorization_mode_mismatch;
    }
    if (!frame.settings.trusted_signer) {
      return error_code::signer_not_configured;
    }
    if (grant.deadline < context.now) {
      frame.info = "deadline " + std::to_string(grant.deadline) +
                   " is before " + std::to_string(context.now);
      return error_code::signature_expired;
    }
    if (frame.ledger.balance_of(operation.to, id) != 0) {
      return error_code::credential_already_held;
    }

    auto nonce_key = key::make_nonce_key(encoder_, operation.to);
    auto nonce = load_nonce(encoder_, frame.transaction, operation.to);
    auto digest = credo::authorization::mint_authorization_digest(
        credo::authorization::mint_claim_t{
            .recipient = operation.to,
            .credential_type_id = id,
            .price = grant.price,
            .deadline = grant.deadline,
            .domain_id = frame.settings.domain_id,
            .nonce = nonce});
    if (!signature_verifier_ ||
        !signature_verifier_(bytes_view_t{digest.data(), digest.size()},
                             *frame.settings.trusted_signer,
                             grant.signature)) {
      frame.info = "signature does not match trusted signer at nonce " +
                   std::to_string(nonce);
      return error_code::invalid_signature;
    }
    if (is_null(operation.to)) {
      return error_code::invalid_identity;
    }
    if (grant.price < type->price) {
      return error_code::authorization_price_below_registered;
    }
    if (context.value < grant.price) {
      frame.info = "value " + context.value.str() + " below price " +
                   grant.price.str();
      return error_code::insufficient_value;
    }

    frame.transaction.put(encoder_, nonce_key, uint64_t{nonce + 1});
    if (auto code =
            frame.ledger.mint(context.caller, operation.to, id, amount_t{1});
        code != error_code::ok) {
      return code;
    }
    frame.events.push_back(make_issued_event(operation.to, id, context.value));
    return error_code::ok;
  });
}

operation_result_t engine::burn(const call_context_t& context,
                                const burn_t& operation) {
  return destroy(context, "burn",
                 burn_batch_t{.holder = operation.holder,
                              .credential_type_ids = {operation.credential_type_id},
                              .amounts = {operation.amount}});
}

operation_result_t engine::burn_batch(const call_context_t& context,
                                      const burn_batch_t& operation) {
  return destroy(context, "burn_batch", operation);
}

operation_result_t engine::destroy(const call_context_t& context,
                                   const std::string_view operation_name,
                                   const burn_batch_t& operation) {
  return run(context, operation_name, [&](call_frame& frame) {
    if (is_null(operation.holder)) {
      return error_code::invalid_identity;
    }
    if (context.caller != operation.holder &&
        !frame.ledger.is_approved_for_all(operation.holder, context.caller)) {
      return error_code::caller_not_holder_or_approved;
    }
    if (auto code = frame.ledger.update(context.caller, operation.holder,
                                        kNullAccount,
                                        operation.credential_type_ids,
                                        operation.amounts);
        code != error_code::ok) {
      return code;
    }
    frame.events.push_back(make_event(
        "credentials_burned",
        {make_attribute("holder", account_hex(operation.holder)),
         make_attribute("operator", account_hex(context.caller)),
         make_attribute("credential_type_ids",
                        join_ids(operation.credential_type_ids)),
         make_attribute("amounts", join_amounts(operation.amounts), false)}));
    return error_code::ok;
  });
}

operation_result_t engine::set_approval_for_all(
    const call_context_t& context,
    const set_approval_for_all_t& operation) {
  return run(context, "set_approval_for_all", [&](call_frame& frame) {
    if (operation.operator_id == context.caller) {
      return error_code::self_approval;
    }
    if (is_null(operation.operator_id)) {
      return error_code::invalid_identity;
    }
    frame.ledger.set_approval_for_all(context.caller, operation.operator_id,
                                      operation.approved);
    frame.events.push_back(make_event(
        "approval_for_all",
        {make_attribute("holder", account_hex(context.caller)),
         make_attribute("operator", account_hex(operation.operator_id)),
         make_attribute("approved", operation.approved ? "true" : "false",
                        false)}));
    return error_code::ok;
  });
}

operation_result_t engine::safe_transfer_from(
    const call_context_t& context,
    const safe_transfer_from_t& operation) {
  return transfer(
      context, "safe_transfer_from",
      safe_batch_transfer_from_t{
          .from = operation.from,
          .to = operation.to,
          .credential_type_ids = {operation.credential_type_id},
          .amounts = {operation.amount}});
}

operation_result_t engine::safe_batch_transfer_from(
    const call_context_t& context,
    const safe_batch_transfer_from_t& operation) {
  return transfer(context, "safe_batch_transfer_from", operation);
}

operation_result_t engine::transfer(
    const call_context_t& context,
    const std::string_view operation_name,
    const safe_batch_transfer_from_t& operation) {
  return run(context, operation_name, [&](call_frame& frame) {
    if (frame.check_recovery_authority(context.caller, operation.from) !=
        error_code::ok) {
      return error_code::non_transferable;
    }
    if (frame.settings.paused) {
      return error_code::paused;
    }
    if (is_null(operation.from) || is_null(operation.to)) {
      return error_code::invalid_identity;
    }
    if (context.caller != operation.from &&
        !frame.ledger.is_approved_for_all(operation.from, context.caller)) {
      return error_code::caller_not_holder_or_approved;
    }
    if (auto code = frame.ledger.move_batch(
            context.caller, operation.from, operation.to,
            operation.credential_type_ids, operation.amounts);
        code != error_code::ok) {
      return code;
    }
    frame.events.push_back(make_event(
        "credentials_transferred",
        {make_attribute("from", account_hex(operation.from)),
         make_attribute("to", account_hex(operation.to)),
         make_attribute("operator", account_hex(context.caller)),
         make_attribute("credential_type_ids",
                        join_ids(operation.credential_type_ids)),
         make_attribute("amounts", join_amounts(operation.amounts), false)}));
    return error_code::ok;
  });
}

operation_result_t engine::recover(const call_context_t& context,
                                   const recover_t& operation) {
  return run(context, "recover", [&](call_frame& frame) {
    if (auto code =
            frame.check_recovery_authority(context.caller, operation.old_holder);
        code != error_code::ok) {
      return code;
    }
    if (frame.settings.paused) {
      return error_code::paused;
    }
    if (is_null(operation.old_holder) || is_null(operation.new_holder) ||
        operation.old_holder == operation.new_holder) {
      return error_code::invalid_identity;
    }

    auto ids = std::vector<credential_type_id_t>{};
    auto amounts = std::vector<amount_t>{};
    const auto next_id = load_next_credential_type_id(encoder_, frame.transaction);
    for (auto id = credential_type_id_t{0}; id < next_id; ++id) {
      auto balance = frame.ledger.balance_of(operation.old_holder, id);
      if (balance > 0) {
        ids.push_back(id);
        amounts.push_back(balance);
      }
    }
    if (ids.empty()) {
      frame.info = account_hex(operation.old_holder) + " holds no credentials";
      return error_code::nothing_to_recover;
    }

    if (auto code = frame.ledger.move_batch(context.caller, operation.old_holder,
                                            operation.new_holder, ids, amounts);
        code != error_code::ok) {
      return code;
    }
    frame.events.push_back(make_event(
        "credentials_recovered",
        {make_attribute("old_holder", account_hex(operation.old_holder)),
         make_attribute("new_holder", account_hex(operation.new_holder)),
         make_attribute("credential_type_ids", join_ids(ids))}));
    frame.data = encoder_.encode(ids);
    frame.info = "recovered " + std::to_string(ids.size()) +
                 " credential type(s)";
    return error_code::ok;
  });
}

operation_result_t engine::receive(const call_context_t& context) {
  return run(context, "receive", [&](call_frame& frame) {
    if (context.value > 0) {
      frame.events.push_back(make_event(
          "value_received",
          {make_attribute("sender", account_hex(context.caller)),
           make_attribute("value", context.value.str(), false)}));
    }
    return error_code::ok;
  });
}

bool engine::is_created(const credential_type_id_t id) const {
  return id < next_credential_type_id();
}

std::optional<credential_type_state_t> engine::credential_type(
    const credential_type_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  auto transaction = transaction_t{storage_};
  return load_credential_type(encoder_, transaction, id);
}

credential_type_id_t engine::next_credential_type_id() const {
  auto lock = std::scoped_lock{mutex_};
  auto transaction = transaction_t{storage_};
  return load_next_credential_type_id(encoder_, transaction);
}

std::optional<std::string> engine::uri(const credential_type_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  if (!is_created(id)) {
    return std::nullopt;
  }
  auto base = base_uri();
  if (base.empty()) {
    return std::string{};
  }
  return base + std::to_string(id);
}

bool engine::is_minter(const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  auto transaction = transaction_t{storage_};
  return minter_present(encoder_, transaction, account);
}

amount_t engine::balance_of(const account_id_t& holder,
                            const credential_type_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  auto transaction = transaction_t{storage_};
  auto ledger = credo::ledger::balance_ledger{encoder_, transaction, nullptr};
  return ledger.balance_of(holder, id);
}

std::optional<std::vector<amount_t>> engine::balance_of_batch(
    const std::vector<account_id_t>& holders,
    const std::vector<credential_type_id_t>& ids) const {
  if (holders.size() != ids.size()) {
    return std::nullopt;
  }
  auto lock = std::scoped_lock{mutex_};
  auto transaction = transaction_t{storage_};
  auto ledger = credo::ledger::balance_ledger{encoder_, transaction, nullptr};
  auto balances = std::vector<amount_t>{};
  balances.reserve(holders.size());
  for (auto i = std::size_t{0}; i < holders.size(); ++i) {
    balances.push_back(ledger.balance_of(holders[i], ids[i]));
  }
  return balances;
}

amount_t engine::total_supply(const credential_type_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  auto transaction = transaction_t{storage_};
  auto ledger = credo::ledger::balance_ledger{encoder_, transaction, nullptr};
  return ledger.total_supply(id);
}

bool engine::exists(const credential_type_id_t id) const {
  return total_supply(id) > 0;
}

bool engine::is_approved_for_all(const account_id_t& holder,
                                 const account_id_t& operator_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto transaction = transaction_t{storage_};
  auto ledger = credo::ledger::balance_ledger{encoder_, transaction, nullptr};
  return ledger.is_approved_for_all(holder, operator_id);
}

uint64_t engine::nonce_of(const account_id_t& holder) const {
  auto lock = std::scoped_lock{mutex_};
  auto transaction = transaction_t{storage_};
  return load_nonce(encoder_, transaction, holder);
}

hash32_t engine::mint_authorization_digest(
    const account_id_t& to,
    const credential_type_id_t id,
    const amount_t& price,
    const timestamp_seconds_t deadline) const {
  auto lock = std::scoped_lock{mutex_};
  auto transaction = transaction_t{storage_};
  return credo::authorization::mint_authorization_digest(
      credo::authorization::mint_claim_t{
          .recipient = to,
          .credential_type_id = id,
          .price = price,
          .deadline = deadline,
          .domain_id = load_settings(encoder_, transaction).domain_id,
          .nonce = load_nonce(encoder_, transaction, to)});
}

engine_settings_t engine::settings() const {
  auto lock = std::scoped_lock{mutex_};
  auto transaction = transaction_t{storage_};
  return load_settings(encoder_, transaction);
}

account_id_t engine::owner() const {
  return settings().owner;
}

bool engine::paused() const {
  return settings().paused;
}

account_id_t engine::treasury() const {
  return settings().treasury;
}

std::optional<signer_id_t> engine::trusted_signer() const {
  return settings().trusted_signer;
}

std::string engine::base_uri() const {
  return settings().base_uri;
}

amount_t engine::forwarded_value(const account_id_t& treasury) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_
      .get<amount_t>(encoder_,
                     key::make_forwarded_value_key(encoder_, treasury))
      .value_or(amount_t{0});
}

uint64_t engine::event_count() const {
  auto lock = std::scoped_lock{mutex_};
  return storage_
      .get<uint64_t>(encoder_, key::make_event_sequence_key(encoder_))
      .value_or(0);
}

std::vector<event_t> engine::events(const uint64_t from_sequence,
                                    const uint64_t to_sequence) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<event_t>{};
  const auto count = event_count();
  for (auto sequence = from_sequence;
       sequence < count && sequence <= to_sequence; ++sequence) {
    auto event = storage_.get<event_t>(
        encoder_, key::make_event_key(encoder_, sequence));
    if (!event) {
      spdlog::error("Event {} missing below sequence head {}", sequence, count);
      credo::common::critical("event log is inconsistent");
    }
    out.push_back(std::move(*event));
  }
  return out;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

void engine::set_value_sink(value_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  value_sink_ = std::move(sink);
}

}  // namespace credo::execution
