#pragma once

#include <tally/ledger/asset_context.hpp>
#include <tally/ledger/staged_state.hpp>
#include <tally/schema/asset_options.hpp>
#include <tally/schema/asset_state.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/feature_state.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace tally::execution {

/// Single-asset ledger service over one storage instance.
///
/// The engine owns the asset record, its capabilities, the feature gates and
/// the whitelist registry. Calls are serialized; each mutating call runs
/// against a fresh staged state that is committed as one batch only when the
/// call succeeds, so a rejected call leaves storage untouched.
class engine final {
 public:
  /// Bind the engine to storage and reload a previously initialized asset.
  engine(tally::scale_encoder_t& encoder,
         tally::ledger::storage_t& storage);
  ~engine();

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Create the asset, its capabilities, closed feature gates and an empty
  /// whitelist. Fails with already_initialized when an asset exists and with
  /// invalid_amount when the holder cap is zero.
  tally::schema::operation_result_t initialize(
      const tally::schema::account_id_t& administrator,
      const tally::schema::asset_options_t& options);

  /// Overwrite both feature gates.
  tally::schema::operation_result_t set_features(
      const tally::schema::account_id_t& caller,
      bool airdrop_enabled,
      bool whitelist_enabled);

  tally::schema::operation_result_t get_features(
      const tally::schema::account_id_t& caller,
      tally::schema::feature_state_t& features) const;

  tally::schema::operation_result_t is_whitelisted(
      const tally::schema::account_id_t& caller,
      const tally::schema::account_id_t& identity,
      bool& member) const;

  /// Add (`add == true`) or remove every identity, or none of them.
  tally::schema::operation_result_t update_whitelist(
      const tally::schema::account_id_t& caller,
      const std::vector<tally::schema::account_id_t>& identities,
      bool add);

  tally::schema::operation_result_t list_whitelist(
      const tally::schema::account_id_t& caller,
      std::vector<tally::schema::account_id_t>& members) const;

  tally::schema::operation_result_t mint(
      const tally::schema::account_id_t& caller,
      const tally::schema::account_id_t& to,
      tally::schema::amount_t amount);

  tally::schema::operation_result_t transfer(
      const tally::schema::account_id_t& caller,
      const tally::schema::account_id_t& from,
      const tally::schema::account_id_t& to,
      tally::schema::amount_t amount);

  tally::schema::operation_result_t burn(
      const tally::schema::account_id_t& caller,
      const tally::schema::account_id_t& from,
      tally::schema::amount_t amount);

  /// Distribute from the administrator's balance; all legs or none.
  tally::schema::operation_result_t airdrop(
      const tally::schema::account_id_t& caller,
      const std::vector<tally::schema::account_id_t>& recipients,
      const std::vector<tally::schema::amount_t>& amounts);

  /// Committed balance of `identity`; zero before initialization.
  tally::schema::amount_t get_balance(
      const tally::schema::account_id_t& identity) const;

  tally::schema::amount_t total_supply() const;

  /// The asset record, or std::nullopt before initialization.
  std::optional<tally::schema::asset_state_t> get_metadata() const;

 private:
  /// Run `operation` in a fresh staged state and commit it on success.
  template <typename Operation>
  tally::schema::operation_result_t execute(std::string_view name,
                                            Operation&& operation);

  /// Run a read-only `operation`; staged writes are never committed.
  template <typename Operation>
  tally::schema::operation_result_t inspect(std::string_view name,
                                            Operation&& operation) const;

  void load_persisted_state();
  tally::schema::operation_result_t asset_missing() const;

  mutable std::mutex mutex_;
  tally::scale_encoder_t& encoder_;
  tally::ledger::storage_t& storage_;
  std::unique_ptr<tally::ledger::asset_context> asset_;
};

}  // namespace tally::execution
