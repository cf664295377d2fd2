#pragma once
#include <string_view>

namespace tally::ledger {

inline constexpr auto kAuthCodespace = std::string_view{"tally.auth"};
inline constexpr auto kLedgerCodespace = std::string_view{"tally.ledger"};
inline constexpr auto kWhitelistCodespace = std::string_view{"tally.whitelist"};
inline constexpr auto kFeaturesCodespace = std::string_view{"tally.features"};
inline constexpr auto kAirdropCodespace = std::string_view{"tally.airdrop"};
inline constexpr auto kEngineCodespace = std::string_view{"tally.engine"};

}  // namespace tally::ledger
