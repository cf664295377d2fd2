#pragma once
#include <tally/ledger/authorization_guard.hpp>
#include <tally/ledger/balance_store.hpp>
#include <tally/ledger/feature_flags.hpp>
#include <tally/ledger/ledger.hpp>
#include <tally/ledger/staged_state.hpp>
#include <tally/ledger/supply_cap_policy.hpp>
#include <tally/ledger/whitelist_registry.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/primitives.hpp>
#include <vector>

namespace tally::ledger {

/// Administrator-funded batch distribution to whitelisted holders.
///
/// The whole batch shares the caller's staged state: the first failing
/// recipient fails the call and the caller discards every transfer made for
/// earlier recipients.
class airdrop_engine final {
 public:
  airdrop_engine(const authorization_guard& guard,
                 const feature_flags& features,
                 const whitelist_registry& whitelist,
                 const supply_cap_policy& cap_policy,
                 const ledger& token_ledger);

  tally::schema::operation_result_t airdrop(
      staged_state& state,
      balance_store& balances,
      const tally::schema::account_id_t& caller,
      const std::vector<tally::schema::account_id_t>& recipients,
      const std::vector<tally::schema::amount_t>& amounts) const;

 private:
  const authorization_guard& guard_;
  const feature_flags& features_;
  const whitelist_registry& whitelist_;
  const supply_cap_policy& cap_policy_;
  const ledger& ledger_;
};

}  // namespace tally::ledger
