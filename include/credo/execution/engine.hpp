#pragma once

#include <credo/execution/engine_config.hpp>
#include <credo/execution/signature_verifier.hpp>
#include <credo/execution/value_sink.hpp>
#include <credo/schema/call_context.hpp>
#include <credo/schema/credential_type_state.hpp>
#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/schema/engine_settings.hpp>
#include <credo/schema/error_code.hpp>
#include <credo/schema/event.hpp>
#include <credo/schema/operation.hpp>
#include <credo/schema/operation_result.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace credo::execution {

/// Soulbound credential state machine.
///
/// Owns the credential registry, the non-transferable balance ledger, the
/// minter set, signer nonces and deployment settings. Every mutating call runs
/// under one lock as an all-or-nothing transition: state is staged, committed
/// in one batch, and only then is attached value forwarded to the treasury.
/// A refused forward reverts the committed batch.
class engine final {
 public:
  /// Open the engine over `storage`. Settings already persisted in the store
  /// win over `config`; an empty store is initialized from `config`.
  explicit engine(
      credo::schema::encoding::encoder<
          credo::schema::encoding::scale_encoder_tag>& encoder,
      credo::storage::storage<credo::storage::rocksdb_storage_tag>& storage,
      const engine_config_t& config);

  /// Dispatch a decoded operation to its handler.
  credo::schema::operation_result_t execute(
      const credo::schema::call_context_t& context,
      const credo::schema::operation_t& operation);

  /// Decode a SCALE `operation_t` and execute it. Undecodable input fails with
  /// `invalid_operation`.
  credo::schema::operation_result_t execute_encoded(
      const credo::schema::call_context_t& context,
      const credo::schema::bytes_view_t& raw_operation);

  // Registry.

  /// Register a credential type; `data` carries the SCALE-encoded new id.
  credo::schema::operation_result_t create_credential_type(
      const credo::schema::call_context_t& context,
      const credo::schema::create_credential_type_t& operation);

  // Access control.

  credo::schema::operation_result_t add_minter(
      const credo::schema::call_context_t& context,
      const credo::schema::add_minter_t& operation);
  credo::schema::operation_result_t remove_minter(
      const credo::schema::call_context_t& context,
      const credo::schema::remove_minter_t& operation);
  credo::schema::operation_result_t set_signer(
      const credo::schema::call_context_t& context,
      const credo::schema::set_signer_t& operation);
  credo::schema::operation_result_t set_treasury(
      const credo::schema::call_context_t& context,
      const credo::schema::set_treasury_t& operation);
  credo::schema::operation_result_t set_base_uri(
      const credo::schema::call_context_t& context,
      const credo::schema::set_base_uri_t& operation);
  credo::schema::operation_result_t set_paused(
      const credo::schema::call_context_t& context,
      const credo::schema::set_paused_t& operation);
  credo::schema::operation_result_t pause(
      const credo::schema::call_context_t& context);
  credo::schema::operation_result_t unpause(
      const credo::schema::call_context_t& context);
  credo::schema::operation_result_t transfer_ownership(
      const credo::schema::call_context_t& context,
      const credo::schema::transfer_ownership_t& operation);

  // Issuance.

  /// Role path: the caller must be a minter.
  credo::schema::operation_result_t mint(
      const credo::schema::call_context_t& context,
      const credo::schema::mint_t& operation);

  /// Signature path: the trusted signer must have signed the digest of
  /// `(to, type, price, deadline, domain, nonce_of(to))`.
  credo::schema::operation_result_t mint_with_authorization(
      const credo::schema::call_context_t& context,
      const credo::schema::mint_with_authorization_t& operation);

  // Ledger.

  credo::schema::operation_result_t burn(
      const credo::schema::call_context_t& context,
      const credo::schema::burn_t& operation);
  credo::schema::operation_result_t burn_batch(
      const credo::schema::call_context_t& context,
      const credo::schema::burn_batch_t& operation);
  credo::schema::operation_result_t set_approval_for_all(
      const credo::schema::call_context_t& context,
      const credo::schema::set_approval_for_all_t& operation);
  credo::schema::operation_result_t safe_transfer_from(
      const credo::schema::call_context_t& context,
      const credo::schema::safe_transfer_from_t& operation);
  credo::schema::operation_result_t safe_batch_transfer_from(
      const credo::schema::call_context_t& context,
      const credo::schema::safe_batch_transfer_from_t& operation);

  // Recovery.

  /// Move every positive balance of `old_holder` to `new_holder`.
  credo::schema::operation_result_t recover(
      const credo::schema::call_context_t& context,
      const credo::schema::recover_t& operation);

  /// Forward `context.value` to the treasury.
  credo::schema::operation_result_t receive(
      const credo::schema::call_context_t& context);

  // Reads.

  bool is_created(credo::schema::credential_type_id_t id) const;
  std::optional<credo::schema::credential_type_state_t> credential_type(
      credo::schema::credential_type_id_t id) const;
  credo::schema::credential_type_id_t next_credential_type_id() const;

  /// `base_uri + decimal(id)`, empty when no base is set, std::nullopt when
  /// the id is not created.
  std::optional<std::string> uri(credo::schema::credential_type_id_t id) const;

  bool is_minter(const credo::schema::account_id_t& account) const;
  credo::schema::amount_t balance_of(
      const credo::schema::account_id_t& holder,
      credo::schema::credential_type_id_t id) const;

  /// std::nullopt when the two lists differ in length.
  std::optional<std::vector<credo::schema::amount_t>> balance_of_batch(
      const std::vector<credo::schema::account_id_t>& holders,
      const std::vector<credo::schema::credential_type_id_t>& ids) const;

  credo::schema::amount_t total_supply(
      credo::schema::credential_type_id_t id) const;
  bool exists(credo::schema::credential_type_id_t id) const;
  bool is_approved_for_all(const credo::schema::account_id_t& holder,
                           const credo::schema::account_id_t& operator_id) const;
  uint64_t nonce_of(const credo::schema::account_id_t& holder) const;

  /// Digest the trusted signer must sign for the next mint to `to`.
  credo::schema::hash32_t mint_authorization_digest(
      const credo::schema::account_id_t& to,
      credo::schema::credential_type_id_t id,
      const credo::schema::amount_t& price,
      credo::schema::timestamp_seconds_t deadline) const;

  credo::schema::engine_settings_t settings() const;
  credo::schema::account_id_t owner() const;
  bool paused() const;
  credo::schema::account_id_t treasury() const;
  std::optional<credo::schema::signer_id_t> trusted_signer() const;
  std::string base_uri() const;

  /// Cumulative value forwarded to `treasury`.
  credo::schema::amount_t forwarded_value(
      const credo::schema::account_id_t& treasury) const;

  /// Number of events persisted so far.
  uint64_t event_count() const;

  /// Persisted events with sequence in [from_sequence, to_sequence].
  std::vector<credo::schema::event_t> events(uint64_t from_sequence,
                                             uint64_t to_sequence) const;

  /// Replace the signature check used by the signature mint path.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Install the treasury value sink. Without one, forwarded value is only
  /// recorded.
  void set_value_sink(value_sink_t sink);

 private:
  struct call_frame;
  using call_body_t = std::function<credo::schema::error_code(call_frame&)>;

  /// Run `body` as one transition: reentrancy guard, staged writes, event
  /// sequencing, commit, then value forwarding.
  credo::schema::operation_result_t run(
      const credo::schema::call_context_t& context,
      std::string_view operation_name,
      const call_body_t& body);

  /// Holder-to-holder move shared by the single and batch transfer calls.
  credo::schema::operation_result_t transfer(
      const credo::schema::call_context_t& context,
      std::string_view operation_name,
      const credo::schema::safe_batch_transfer_from_t& operation);

  /// Burn shared by the single and batch burn calls.
  credo::schema::operation_result_t destroy(
      const credo::schema::call_context_t& context,
      std::string_view operation_name,
      const credo::schema::burn_batch_t& operation);

  /// Persist settings from `config` when the store has none.
  void load_or_initialize_settings(const engine_config_t& config);

  mutable std::recursive_mutex mutex_;
  credo::schema::encoding::encoder<credo::schema::encoding::scale_encoder_tag>&
      encoder_;
  credo::storage::storage<credo::storage::rocksdb_storage_tag>& storage_;
  bool executing_{false};
  signature_verifier_t signature_verifier_;
  value_sink_t value_sink_;
};

}  // namespace credo::execution
