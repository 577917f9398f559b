#pragma once
#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/schema/error_code.hpp>
#include <credo/schema/primitives.hpp>
#include <credo/storage/rocksdb/storage.hpp>
#include <credo/storage/state_transaction.hpp>
#include <functional>
#include <vector>

namespace credo::ledger {

using encoder_t = credo::schema::encoding::encoder<
    credo::schema::encoding::scale_encoder_tag>;
using transaction_t =
    credo::storage::state_transaction<credo::storage::rocksdb_storage_tag>;

/// Decides whether `operator_id` may move units out of `from` into another
/// non-null holder.
using transfer_guard_t =
    std::function<bool(const credo::schema::account_id_t& operator_id,
                       const credo::schema::account_id_t& from)>;

/// Holder balances, per-type supply and operator approvals staged in one
/// state transaction.
///
/// Every balance change goes through `update`. A move from the null account is
/// a mint, a move to it is a burn; anything else must pass the transfer guard.
/// On an error some writes of the failed call may already be staged; the
/// caller drops the transaction.
class balance_ledger final {
 public:
  balance_ledger(encoder_t& encoder,
                 transaction_t& transaction,
                 transfer_guard_t guard);

  credo::schema::amount_t balance_of(
      const credo::schema::account_id_t& holder,
      credo::schema::credential_type_id_t id) const;

  credo::schema::amount_t total_supply(
      credo::schema::credential_type_id_t id) const;

  bool is_approved_for_all(const credo::schema::account_id_t& holder,
                           const credo::schema::account_id_t& operator_id) const;

  void set_approval_for_all(const credo::schema::account_id_t& holder,
                            const credo::schema::account_id_t& operator_id,
                            bool approved);

  credo::schema::error_code update(
      const credo::schema::account_id_t& operator_id,
      const credo::schema::account_id_t& from,
      const credo::schema::account_id_t& to,
      const std::vector<credo::schema::credential_type_id_t>& ids,
      const std::vector<credo::schema::amount_t>& amounts);

  credo::schema::error_code mint(
      const credo::schema::account_id_t& operator_id,
      const credo::schema::account_id_t& to,
      credo::schema::credential_type_id_t id,
      const credo::schema::amount_t& amount);

  credo::schema::error_code burn(
      const credo::schema::account_id_t& operator_id,
      const credo::schema::account_id_t& from,
      credo::schema::credential_type_id_t id,
      const credo::schema::amount_t& amount);

  credo::schema::error_code move_batch(
      const credo::schema::account_id_t& operator_id,
      const credo::schema::account_id_t& from,
      const credo::schema::account_id_t& to,
      const std::vector<credo::schema::credential_type_id_t>& ids,
      const std::vector<credo::schema::amount_t>& amounts);

 private:
  void store_balance(const credo::schema::account_id_t& holder,
                     credo::schema::credential_type_id_t id,
                     const credo::schema::amount_t& amount);
  void store_supply(credo::schema::credential_type_id_t id,
                    const credo::schema::amount_t& amount);

  encoder_t& encoder_;
  transaction_t& transaction_;
  transfer_guard_t guard_;
};

}  // namespace credo::ledger
