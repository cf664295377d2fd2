#pragma once
#include <tally/schema/primitives.hpp>
#include <string_view>

// Schema key type: ledger keys.
// Ledger workflow: Deterministic keyspace for the asset record, feature gates,
// whitelist membership, balances and supply.
namespace tally::schema::key {

inline constexpr auto kAssetStateKey = std::string_view{"TALLY|ASSET"};
inline constexpr auto kFeatureStatePrefix = std::string_view{"TALLY|FEATURES|"};
inline constexpr auto kWhitelistPrefix = std::string_view{"TALLY|WHITELIST|"};
inline constexpr auto kBalancePrefix = std::string_view{"TALLY|BALANCE|"};
inline constexpr auto kSupplyPrefix = std::string_view{"TALLY|SUPPLY|"};

bytes_t make_asset_state_key();
bytes_t make_feature_state_key(const asset_id_t& asset_id);
bytes_t make_whitelist_prefix(const asset_id_t& asset_id);
bytes_t make_whitelist_key(const asset_id_t& asset_id,
                           const account_id_t& account);
bytes_t make_balance_prefix(const asset_id_t& asset_id);
bytes_t make_balance_key(const asset_id_t& asset_id,
                         const account_id_t& account);
bytes_t make_supply_key(const asset_id_t& asset_id);

/// Recover the account id from a whitelist or balance key under `prefix`.
std::optional<account_id_t> parse_account_suffix(const bytes_view_t& key,
                                                 const bytes_view_t& prefix);

/// Asset identity: BLAKE3 over the administrator and the asset symbol.
asset_id_t derive_asset_id(const account_id_t& administrator,
                           const std::string_view& symbol);

}  // namespace tally::schema::key
