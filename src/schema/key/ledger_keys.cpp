#include <tally/blake3/hash.hpp>
#include <tally/schema/key/builder.hpp>
#include <tally/schema/key/ledger_keys.hpp>

#include <algorithm>

using namespace tally::schema;

namespace tally::schema::key {

bytes_t make_asset_state_key() {
  auto b = builder{};
  b.write(kAssetStateKey);
  return b.data;
}

bytes_t make_feature_state_key(const asset_id_t& asset_id) {
  auto b = builder{};
  b.write(kFeatureStatePrefix);
  b.write(std::span(asset_id.data(), asset_id.size()));
  return b.data;
}

bytes_t make_whitelist_prefix(const asset_id_t& asset_id) {
  auto b = builder{};
  b.write(kWhitelistPrefix);
  b.write(std::span(asset_id.data(), asset_id.size()));
  b.write("|");
  return b.data;
}

bytes_t make_whitelist_key(const asset_id_t& asset_id,
                           const account_id_t& account) {
  auto b = builder{.data = make_whitelist_prefix(asset_id)};
  b.write(std::span(account.data(), account.size()));
  return b.data;
}

bytes_t make_balance_prefix(const asset_id_t& asset_id) {
  auto b = builder{};
  b.write(kBalancePrefix);
  b.write(std::span(asset_id.data(), asset_id.size()));
  b.write("|");
  return b.data;
}

bytes_t make_balance_key(const asset_id_t& asset_id,
                         const account_id_t& account) {
  auto b = builder{.data = make_balance_prefix(asset_id)};
  b.write(std::span(account.data(), account.size()));
  return b.data;
}

bytes_t make_supply_key(const asset_id_t& asset_id) {
  auto b = builder{};
  b.write(kSupplyPrefix);
  b.write(std::span(asset_id.data(), asset_id.size()));
  return b.data;
}

std::optional<account_id_t> parse_account_suffix(const bytes_view_t& key,
                                                 const bytes_view_t& prefix) {
  auto account = account_id_t{};
  if (key.size() != prefix.size() + account.size() ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  std::copy(std::begin(key) + static_cast<std::ptrdiff_t>(prefix.size()),
            std::end(key), std::begin(account));
  return account;
}

asset_id_t derive_asset_id(const account_id_t& administrator,
                           const std::string_view& symbol) {
  auto b = builder{};
  b.write("TALLY|ASSETID|");
  b.write(std::span(administrator.data(), administrator.size()));
  b.write("|");
  b.write(symbol);
  return tally::blake3::hash(bytes_view_t{b.data.data(), b.data.size()});
}

}  // namespace tally::schema::key
