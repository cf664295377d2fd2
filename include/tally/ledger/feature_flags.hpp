#pragma once
#include <tally/ledger/staged_state.hpp>
#include <tally/schema/feature_state.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/primitives.hpp>

namespace tally::ledger {

/// Airdrop and whitelist gates of one asset.
///
/// Administrator checks happen in the engine before store(); the airdrop
/// engine and the whitelist registry read the gates through load().
class feature_flags final {
 public:
  explicit feature_flags(const tally::schema::asset_id_t& asset_id);

  tally::schema::feature_state_t load(const staged_state& state) const;

  /// Overwrite both gates; no relation between them is enforced.
  void store(staged_state& state,
             const tally::schema::feature_state_t& features) const;

  /// feature_inactive unless the airdrop gate is open.
  tally::schema::operation_result_t require_airdrop(
      const staged_state& state) const;

  /// feature_inactive unless the whitelist gate is open.
  tally::schema::operation_result_t require_whitelist(
      const staged_state& state) const;

 private:
  tally::schema::asset_id_t asset_id_;
};

}  // namespace tally::ledger
