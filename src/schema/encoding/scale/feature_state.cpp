#include <tally/schema/encoding/scale/feature_state.hpp>

using namespace tally::schema;

namespace tally::schema::encoding::scale {

feature_state_record_t to_record(const feature_state<1>& o) {
  return feature_state_record_t{o.version, o.airdrop_enabled,
                                o.whitelist_enabled};
}

feature_state<1> from_record(const feature_state_record_t& record) {
  return feature_state<1>{.version = std::get<0>(record),
                          .airdrop_enabled = std::get<1>(record),
                          .whitelist_enabled = std::get<2>(record)};
}

}  // namespace tally::schema::encoding::scale
