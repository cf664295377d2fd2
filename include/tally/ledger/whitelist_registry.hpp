#pragma once
#include <tally/ledger/feature_flags.hpp>
#include <tally/ledger/staged_state.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/primitives.hpp>
#include <vector>

namespace tally::ledger {

/// Set of holders eligible to receive airdrops.
///
/// add_many/remove_many process entries in order against the caller's staged
/// state and stop at the first violation; the caller discards the stage on
/// failure, so a rejected call never changes membership. A repeated identity
/// within one add_many call is rejected as already whitelisted.
class whitelist_registry final {
 public:
  whitelist_registry(const tally::schema::asset_id_t& asset_id,
                     const feature_flags& features);

  bool contains(const staged_state& state,
                const tally::schema::account_id_t& identity) const;

  tally::schema::operation_result_t add_many(
      staged_state& state,
      const std::vector<tally::schema::account_id_t>& identities) const;

  tally::schema::operation_result_t remove_many(
      staged_state& state,
      const std::vector<tally::schema::account_id_t>& identities) const;

  /// Members in key order.
  std::vector<tally::schema::account_id_t> members(
      const staged_state& state) const;

 private:
  tally::schema::operation_result_t check_request(
      const staged_state& state,
      const std::vector<tally::schema::account_id_t>& identities) const;

  tally::schema::asset_id_t asset_id_;
  const feature_flags& features_;
};

}  // namespace tally::ledger
