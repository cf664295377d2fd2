#include <tally/ledger/asset_context.hpp>

namespace tally::ledger {

asset_context::asset_context(const tally::schema::asset_state_t& asset)
    : asset_{asset},
      capabilities_{},
      guard_{asset_.administrator, capabilities_},
      cap_policy_{asset_.max_per_holder},
      features_{asset_.asset_id},
      whitelist_{asset_.asset_id, features_},
      ledger_{guard_, cap_policy_},
      airdrops_{guard_, features_, whitelist_, cap_policy_, ledger_} {}

}  // namespace tally::ledger
