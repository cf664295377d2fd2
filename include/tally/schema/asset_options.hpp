#pragma once
#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

// Schema type: asset options.
// Ledger workflow: Deployment parameters supplied once to initialize.
namespace tally::schema {

inline constexpr amount_t kDefaultMaxPerHolder = 100;

template <uint16_t Version>
struct asset_options;

template <>
struct asset_options<1> final {
  uint16_t version{1};
  std::string symbol{"TALLY"};
  std::string name{"Tally"};
  uint8_t decimals{};
  amount_t max_per_holder{kDefaultMaxPerHolder};
};

using asset_options_t = asset_options<1>;

/// Narrow a user-supplied decimal count; std::nullopt when it does not fit
/// the record's 8-bit field.
inline constexpr std::optional<uint8_t> make_decimals(const uint64_t value) {
  if (value > std::numeric_limits<uint8_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(value);
}

}  // namespace tally::schema
