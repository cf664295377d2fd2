#pragma once
#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: asset state.
// Ledger workflow: Immutable identity and policy record of the managed unit,
// written once by initialize. `paused` is persisted but not consulted by any
// operation.
namespace tally::schema {

template <uint16_t Version>
struct asset_state;

template <>
struct asset_state<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
  account_id_t administrator{};
  std::string symbol;
  std::string name;
  uint8_t decimals{};
  amount_t max_per_holder{};
  bool paused{};
};

using asset_state_t = asset_state<1>;

}  // namespace tally::schema
