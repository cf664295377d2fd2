#pragma once
#include <cstdint>

// Schema type: feature state.
// Ledger workflow: Administrator-controlled gates for airdrop distribution and
// whitelist maintenance.
namespace tally::schema {

template <uint16_t Version>
struct feature_state;

template <>
struct feature_state<1> final {
  uint16_t version{1};
  bool airdrop_enabled{};
  bool whitelist_enabled{};
};

using feature_state_t = feature_state<1>;

}  // namespace tally::schema
