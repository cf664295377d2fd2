#include <spdlog/fmt/fmt.h>
#include <tally/ledger/codespace.hpp>
#include <tally/ledger/whitelist_registry.hpp>
#include <tally/schema/key/ledger_keys.hpp>

using namespace tally::schema;

namespace tally::ledger {

whitelist_registry::whitelist_registry(const asset_id_t& asset_id,
                                       const feature_flags& features)
    : asset_id_{asset_id}, features_{features} {}

bool whitelist_registry::contains(const staged_state& state,
                                  const account_id_t& identity) const {
  auto whitelist_key = key::make_whitelist_key(asset_id_, identity);
  return state.contains(make_bytes_view(whitelist_key));
}

operation_result_t whitelist_registry::check_request(
    const staged_state& state,
    const std::vector<account_id_t>& identities) const {
  if (identities.empty()) {
    return make_error_result(ledger_error_code::invalid_address_list,
                             "identity list is empty", kWhitelistCodespace);
  }
  return features_.require_whitelist(state);
}

operation_result_t whitelist_registry::add_many(
    staged_state& state,
    const std::vector<account_id_t>& identities) const {
  auto result = check_request(state, identities);
  if (!succeeded(result)) {
    return result;
  }

  for (std::size_t i = 0; i < identities.size(); ++i) {
    if (contains(state, identities[i])) {
      return make_error_result(
          ledger_error_code::already_whitelisted,
          fmt::format("entry {} ({}) is already whitelisted", i,
                      to_hex(identities[i])),
          kWhitelistCodespace);
    }
    auto whitelist_key = key::make_whitelist_key(asset_id_, identities[i]);
    state.put(make_bytes_view(whitelist_key), true);
  }
  return {};
}

operation_result_t whitelist_registry::remove_many(
    staged_state& state,
    const std::vector<account_id_t>& identities) const {
  auto result = check_request(state, identities);
  if (!succeeded(result)) {
    return result;
  }

  for (std::size_t i = 0; i < identities.size(); ++i) {
    if (!contains(state, identities[i])) {
      return make_error_result(
          ledger_error_code::not_whitelisted,
          fmt::format("entry {} ({}) is not whitelisted", i,
                      to_hex(identities[i])),
          kWhitelistCodespace);
    }
    auto whitelist_key = key::make_whitelist_key(asset_id_, identities[i]);
    state.erase(make_bytes_view(whitelist_key));
  }
  return {};
}

std::vector<account_id_t> whitelist_registry::members(
    const staged_state& state) const {
  auto prefix = key::make_whitelist_prefix(asset_id_);
  auto members = std::vector<account_id_t>{};
  for (const auto& entry : state.list_by_prefix(make_bytes_view(prefix))) {
    auto account = key::parse_account_suffix(make_bytes_view(entry.first),
                                             make_bytes_view(prefix));
    if (!account) {
      tally::common::critical("malformed whitelist key");
    }
    members.push_back(*account);
  }
  return members;
}

}  // namespace tally::ledger
