#include <tally/schema/encoding/scale/asset_state.hpp>

using namespace tally::schema;

namespace tally::schema::encoding::scale {

asset_state_record_t to_record(const asset_state<1>& o) {
  return asset_state_record_t{o.version,  o.asset_id, o.administrator,
                              o.symbol,   o.name,     o.decimals,
                              o.max_per_holder, o.paused};
}

asset_state<1> from_record(const asset_state_record_t& record) {
  return asset_state<1>{.version = std::get<0>(record),
                        .asset_id = std::get<1>(record),
                        .administrator = std::get<2>(record),
                        .symbol = std::get<3>(record),
                        .name = std::get<4>(record),
                        .decimals = std::get<5>(record),
                        .max_per_holder = std::get<6>(record),
                        .paused = std::get<7>(record)};
}

}  // namespace tally::schema::encoding::scale
