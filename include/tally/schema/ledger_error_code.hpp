#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tally::schema {

enum class ledger_error_code : uint32_t {
  ok = 0,
  permission_denied = 1,
  capacity_exceeded = 2,
  insufficient_balance = 3,
  feature_inactive = 4,
  length_mismatch = 5,
  invalid_amount = 6,
  invalid_address_list = 7,
  already_whitelisted = 8,
  not_whitelisted = 9,
  asset_missing = 10,
  already_initialized = 11,
};

inline constexpr auto kLedgerErrorCodeMappings = std::array{
    std::pair<std::string_view, ledger_error_code>{"ok",
                                                   ledger_error_code::ok},
    std::pair<std::string_view, ledger_error_code>{
        "permission_denied", ledger_error_code::permission_denied},
    std::pair<std::string_view, ledger_error_code>{
        "capacity_exceeded", ledger_error_code::capacity_exceeded},
    std::pair<std::string_view, ledger_error_code>{
        "insufficient_balance", ledger_error_code::insufficient_balance},
    std::pair<std::string_view, ledger_error_code>{
        "feature_inactive", ledger_error_code::feature_inactive},
    std::pair<std::string_view, ledger_error_code>{
        "length_mismatch", ledger_error_code::length_mismatch},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_amount", ledger_error_code::invalid_amount},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_address_list", ledger_error_code::invalid_address_list},
    std::pair<std::string_view, ledger_error_code>{
        "already_whitelisted", ledger_error_code::already_whitelisted},
    std::pair<std::string_view, ledger_error_code>{
        "not_whitelisted", ledger_error_code::not_whitelisted},
    std::pair<std::string_view, ledger_error_code>{
        "asset_missing", ledger_error_code::asset_missing},
    std::pair<std::string_view, ledger_error_code>{
        "already_initialized", ledger_error_code::already_initialized},
};

inline constexpr std::string_view to_string(const ledger_error_code value) {
  return to_string(value, kLedgerErrorCodeMappings).value_or("unknown");
}

}  // namespace tally::schema
