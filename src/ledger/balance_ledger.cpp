#include <spdlog/spdlog.h>
#include <credo/ledger/balance_ledger.hpp>
#include <credo/schema/key/engine_keys.hpp>
#include <utility>

using namespace credo::schema;

namespace credo::ledger {

balance_ledger::balance_ledger(encoder_t& encoder,
                               transaction_t& transaction,
                               transfer_guard_t guard)
    : encoder_{encoder}, transaction_{transaction}, guard_{std::move(guard)} {}

amount_t balance_ledger::balance_of(const account_id_t& holder,
                                    const credential_type_id_t id) const {
  return transaction_
      .get<amount_t>(encoder_, key::make_balance_key(encoder_, holder, id))
      .value_or(amount_t{0});
}

amount_t balance_ledger::total_supply(const credential_type_id_t id) const {
  return transaction_.get<amount_t>(encoder_, key::make_supply_key(encoder_, id))
      .value_or(amount_t{0});
}

bool balance_ledger::is_approved_for_all(const account_id_t& holder,
                                         const account_id_t& operator_id) const {
  return transaction_
      .get<bool>(encoder_,
                 key::make_operator_approval_key(encoder_, holder, operator_id))
      .value_or(false);
}

void balance_ledger::set_approval_for_all(const account_id_t& holder,
                                          const account_id_t& operator_id,
                                          const bool approved) {
  auto key = key::make_operator_approval_key(encoder_, holder, operator_id);
  if (approved) {
    transaction_.put(encoder_, key, true);
  } else {
    transaction_.erase(key);
  }
}

error_code balance_ledger::update(const account_id_t& operator_id,
                                  const account_id_t& from,
                                  const account_id_t& to,
                                  const std::vector<credential_type_id_t>& ids,
                                  const std::vector<amount_t>& amounts) {
  if (ids.size() != amounts.size()) {
    return error_code::length_mismatch;
  }
  if (is_null(from) && is_null(to)) {
    return error_code::invalid_identity;
  }
  if (!is_null(from) && !is_null(to) && !(guard_ && guard_(operator_id, from))) {
    spdlog::debug("Rejected holder-to-holder move by {}",
                  to_hex(bytes_view_t{operator_id.data(), operator_id.size()}));
    return error_code::non_transferable;
  }

  for (auto i = std::size_t{0}; i < ids.size(); ++i) {
    const auto id = ids[i];
    const auto& amount = amounts[i];
    if (is_null(from)) {
      store_supply(id, total_supply(id) + amount);
    } else {
      auto balance = balance_of(from, id);
      if (balance < amount) {
        return error_code::insufficient_balance;
      }
      store_balance(from, id, balance - amount);
    }
    if (is_null(to)) {
      store_supply(id, total_supply(id) - amount);
    } else {
      store_balance(to, id, balance_of(to, id) + amount);
    }
  }
  return error_code::ok;
}

error_code balance_ledger::mint(const account_id_t& operator_id,
                                const account_id_t& to,
                                const credential_type_id_t id,
                                const amount_t& amount) {
  if (is_null(to)) {
    return error_code::invalid_identity;
  }
  return update(operator_id, kNullAccount, to, {id}, {amount});
}

error_code balance_ledger::burn(const account_id_t& operator_id,
                                const account_id_t& from,
                                const credential_type_id_t id,
                                const amount_t& amount) {
  if (is_null(from)) {
    return error_code::invalid_identity;
  }
  return update(operator_id, from, kNullAccount, {id}, {amount});
}

error_code balance_ledger::move_batch(
    const account_id_t& operator_id,
    const account_id_t& from,
    const account_id_t& to,
    const std::vector<credential_type_id_t>& ids,
    const std::vector<amount_t>& amounts) {
  if (is_null(from) || is_null(to)) {
    return error_code::invalid_identity;
  }
  return update(operator_id, from, to, ids, amounts);
}

void balance_ledger::store_balance(const account_id_t& holder,
                                   const credential_type_id_t id,
                                   const amount_t& amount) {
  auto key = key::make_balance_key(encoder_, holder, id);
  if (amount == 0) {
    transaction_.erase(key);
  } else {
    transaction_.put(encoder_, key, amount);
  }
}

void balance_ledger::store_supply(const credential_type_id_t id,
                                  const amount_t& amount) {
  auto key = key::make_supply_key(encoder_, id);
  if (amount == 0) {
    transaction_.erase(key);
  } else {
    transaction_.put(encoder_, key, amount);
  }
}

}  // namespace credo::ledger
