#include <spdlog/fmt/fmt.h>
#include <tally/ledger/codespace.hpp>
#include <tally/ledger/ledger.hpp>

using namespace tally::schema;

namespace tally::ledger {

ledger::ledger(const authorization_guard& guard,
               const supply_cap_policy& cap_policy)
    : guard_{guard}, cap_policy_{cap_policy} {}

operation_result_t ledger::mint(balance_store& balances,
                                const account_id_t& caller,
                                const account_id_t& to,
                                const amount_t amount) const {
  auto capabilities = guard_.require_admin(caller);
  if (!capabilities) {
    return authorization_guard::permission_denied(caller);
  }
  auto result = cap_policy_.check_cap(to, balances.balance(to), amount);
  if (!succeeded(result)) {
    return result;
  }
  return balances.mint(capabilities->get().mint, to, amount);
}

operation_result_t ledger::transfer(balance_store& balances,
                                    const account_id_t& caller,
                                    const account_id_t& from,
                                    const account_id_t& to,
                                    const amount_t amount) const {
  auto capabilities = guard_.require_admin(caller);
  if (!capabilities) {
    return authorization_guard::permission_denied(caller);
  }
  auto available = balances.balance(from);
  if (available < amount) {
    return make_error_result(
        ledger_error_code::insufficient_balance,
        fmt::format("{} holds {}, needs {}", to_hex(from), available, amount),
        kLedgerCodespace);
  }
  auto result = cap_policy_.check_cap(to, balances.balance(to), amount);
  if (!succeeded(result)) {
    return result;
  }
  return balances.transfer(capabilities->get().transfer, from, to, amount);
}

operation_result_t ledger::burn(balance_store& balances,
                                const account_id_t& caller,
                                const account_id_t& from,
                                const amount_t amount) const {
  auto capabilities = guard_.require_admin(caller);
  if (!capabilities) {
    return authorization_guard::permission_denied(caller);
  }
  // Sufficiency is enforced by the store's debit.
  return balances.burn(capabilities->get().burn, from, amount);
}

}  // namespace tally::ledger
