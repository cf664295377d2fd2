#pragma once
#include <tally/schema/asset_state.hpp>
#include <string>
#include <tuple>

namespace tally::schema::encoding::scale {

// Wire layout of asset_state<1>, in field order.
using asset_state_record_t = std::tuple<uint16_t,
                                        tally::schema::asset_id_t,
                                        tally::schema::account_id_t,
                                        std::string,
                                        std::string,
                                        uint8_t,
                                        uint64_t,
                                        bool>;

asset_state_record_t to_record(const tally::schema::asset_state<1>& o);
tally::schema::asset_state<1> from_record(const asset_state_record_t& record);

}  // namespace tally::schema::encoding::scale
