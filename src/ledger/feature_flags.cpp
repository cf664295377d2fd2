#include <tally/ledger/codespace.hpp>
#include <tally/ledger/feature_flags.hpp>
#include <tally/schema/encoding/scale/feature_state.hpp>
#include <tally/schema/key/ledger_keys.hpp>

using namespace tally::schema;

namespace tally::ledger {

feature_flags::feature_flags(const asset_id_t& asset_id)
    : asset_id_{asset_id} {}

feature_state_t feature_flags::load(const staged_state& state) const {
  auto features_key = key::make_feature_state_key(asset_id_);
  auto record = state.get<encoding::scale::feature_state_record_t>(
      make_bytes_view(features_key));
  if (!record) {
    return feature_state_t{};
  }
  return encoding::scale::from_record(*record);
}

void feature_flags::store(staged_state& state,
                          const feature_state_t& features) const {
  auto features_key = key::make_feature_state_key(asset_id_);
  state.put(make_bytes_view(features_key), encoding::scale::to_record(features));
}

operation_result_t feature_flags::require_airdrop(
    const staged_state& state) const {
  if (!load(state).airdrop_enabled) {
    return make_error_result(ledger_error_code::feature_inactive,
                             "airdrop is disabled", kFeaturesCodespace);
  }
  return {};
}

operation_result_t feature_flags::require_whitelist(
    const staged_state& state) const {
  if (!load(state).whitelist_enabled) {
    return make_error_result(ledger_error_code::feature_inactive,
                             "whitelist is disabled", kFeaturesCodespace);
  }
  return {};
}

}  // namespace tally::ledger
