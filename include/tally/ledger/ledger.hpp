#pragma once
#include <tally/ledger/authorization_guard.hpp>
#include <tally/ledger/balance_store.hpp>
#include <tally/ledger/supply_cap_policy.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/primitives.hpp>

namespace tally::ledger {

/// Administrator-only mint, operator transfer and burn.
///
/// Every call re-checks the caller against the guard before touching any
/// balance, even when invoked from another component.
class ledger final {
 public:
  ledger(const authorization_guard& guard, const supply_cap_policy& cap_policy);

  tally::schema::operation_result_t mint(
      balance_store& balances,
      const tally::schema::account_id_t& caller,
      const tally::schema::account_id_t& to,
      tally::schema::amount_t amount) const;

  /// Move `amount` from `from` to `to` on the administrator's authority.
  tally::schema::operation_result_t transfer(
      balance_store& balances,
      const tally::schema::account_id_t& caller,
      const tally::schema::account_id_t& from,
      const tally::schema::account_id_t& to,
      tally::schema::amount_t amount) const;

  tally::schema::operation_result_t burn(
      balance_store& balances,
      const tally::schema::account_id_t& caller,
      const tally::schema::account_id_t& from,
      tally::schema::amount_t amount) const;

 private:
  const authorization_guard& guard_;
  const supply_cap_policy& cap_policy_;
};

}  // namespace tally::ledger
