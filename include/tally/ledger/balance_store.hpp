#pragma once
#include <tally/ledger/capability.hpp>
#include <tally/ledger/staged_state.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/primitives.hpp>

namespace tally::ledger {

/// Per-holder quantities and total supply of one asset.
///
/// Reads are open to anyone. Every mutation requires the matching capability
/// token, so only code that passed the authorization guard can change a
/// balance. Caps are not enforced here.
class balance_store final {
 public:
  balance_store(staged_state& state, const tally::schema::asset_id_t& asset_id);

  tally::schema::amount_t balance(
      const tally::schema::account_id_t& holder) const;
  tally::schema::amount_t total_supply() const;

  tally::schema::operation_result_t mint(
      const mint_capability& capability,
      const tally::schema::account_id_t& to,
      tally::schema::amount_t amount);

  tally::schema::operation_result_t transfer(
      const transfer_capability& capability,
      const tally::schema::account_id_t& from,
      const tally::schema::account_id_t& to,
      tally::schema::amount_t amount);

  tally::schema::operation_result_t burn(
      const burn_capability& capability,
      const tally::schema::account_id_t& from,
      tally::schema::amount_t amount);

 private:
  tally::schema::operation_result_t credit(
      const tally::schema::account_id_t& holder,
      tally::schema::amount_t amount);
  tally::schema::operation_result_t debit(
      const tally::schema::account_id_t& holder,
      tally::schema::amount_t amount);
  void store_balance(const tally::schema::account_id_t& holder,
                     tally::schema::amount_t amount);

  staged_state& state_;
  tally::schema::asset_id_t asset_id_;
};

}  // namespace tally::ledger
