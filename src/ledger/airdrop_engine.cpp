#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <tally/ledger/airdrop_engine.hpp>
#include <tally/ledger/codespace.hpp>

#include <utility>

using namespace tally::schema;

namespace tally::ledger {

namespace {

operation_result_t at_recipient(operation_result_t result,
                                const std::size_t index) {
  result.info = fmt::format("recipient {}: {}", index, result.info);
  return result;
}

}  // namespace

airdrop_engine::airdrop_engine(const authorization_guard& guard,
                               const feature_flags& features,
                               const whitelist_registry& whitelist,
                               const supply_cap_policy& cap_policy,
                               const ledger& token_ledger)
    : guard_{guard},
      features_{features},
      whitelist_{whitelist},
      cap_policy_{cap_policy},
      ledger_{token_ledger} {}

operation_result_t airdrop_engine::airdrop(
    staged_state& state,
    balance_store& balances,
    const account_id_t& caller,
    const std::vector<account_id_t>& recipients,
    const std::vector<amount_t>& amounts) const {
  if (!guard_.require_admin(caller)) {
    return authorization_guard::permission_denied(caller);
  }

  auto result = features_.require_airdrop(state);
  if (!succeeded(result)) {
    return result;
  }
  result = features_.require_whitelist(state);
  if (!succeeded(result)) {
    return result;
  }

  if (recipients.size() != amounts.size()) {
    return make_error_result(
        ledger_error_code::length_mismatch,
        fmt::format("{} recipients but {} amounts", recipients.size(),
                    amounts.size()),
        kAirdropCodespace);
  }

  for (std::size_t i = 0; i < recipients.size(); ++i) {
    const auto& recipient = recipients[i];
    const auto amount = amounts[i];

    if (!whitelist_.contains(state, recipient)) {
      return make_error_result(
          ledger_error_code::not_whitelisted,
          fmt::format("recipient {} ({}) is not whitelisted", i,
                      to_hex(recipient)),
          kAirdropCodespace);
    }
    result = cap_policy_.check_cap(recipient, balances.balance(recipient),
                                   amount);
    if (!succeeded(result)) {
      return at_recipient(std::move(result), i);
    }
    if (amount == 0) {
      return make_error_result(ledger_error_code::invalid_amount,
                               fmt::format("recipient {}: amount is zero", i),
                               kAirdropCodespace);
    }

    result = ledger_.transfer(balances, caller, caller, recipient, amount);
    if (!succeeded(result)) {
      return at_recipient(std::move(result), i);
    }
    spdlog::debug("Airdrop leg {} staged: {} units to {}", i, amount,
                  to_hex(recipient));
  }
  return result;
}

}  // namespace tally::ledger
