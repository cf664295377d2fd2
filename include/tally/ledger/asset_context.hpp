#pragma once
#include <tally/ledger/airdrop_engine.hpp>
#include <tally/ledger/authorization_guard.hpp>
#include <tally/ledger/capability.hpp>
#include <tally/ledger/feature_flags.hpp>
#include <tally/ledger/ledger.hpp>
#include <tally/ledger/supply_cap_policy.hpp>
#include <tally/ledger/whitelist_registry.hpp>
#include <tally/schema/asset_state.hpp>

namespace tally::ledger {

/// Everything that exists only once the asset does: the record, the
/// capability set minted for it and the components wired to both.
///
/// Members reference each other, so a context is neither copied nor moved.
class asset_context final {
 public:
  explicit asset_context(const tally::schema::asset_state_t& asset);

  asset_context(const asset_context&) = delete;
  asset_context& operator=(const asset_context&) = delete;
  asset_context(asset_context&&) = delete;
  asset_context& operator=(asset_context&&) = delete;
  ~asset_context() = default;

  const tally::schema::asset_state_t& asset() const { return asset_; }
  const authorization_guard& guard() const { return guard_; }
  const supply_cap_policy& cap_policy() const { return cap_policy_; }
  const feature_flags& features() const { return features_; }
  const whitelist_registry& whitelist() const { return whitelist_; }
  const ledger& token_ledger() const { return ledger_; }
  const airdrop_engine& airdrops() const { return airdrops_; }

 private:
  tally::schema::asset_state_t asset_;
  capability_set capabilities_;
  authorization_guard guard_;
  supply_cap_policy cap_policy_;
  feature_flags features_;
  whitelist_registry whitelist_;
  ledger ledger_;
  airdrop_engine airdrops_;
};

}  // namespace tally::ledger
