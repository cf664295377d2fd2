#pragma once
#include <tally/schema/feature_state.hpp>
#include <tuple>

namespace tally::schema::encoding::scale {

using feature_state_record_t = std::tuple<uint16_t, bool, bool>;

feature_state_record_t to_record(const tally::schema::feature_state<1>& o);
tally::schema::feature_state<1> from_record(
    const feature_state_record_t& record);

}  // namespace tally::schema::encoding::scale
