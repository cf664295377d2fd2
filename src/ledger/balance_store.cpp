#include <spdlog/fmt/fmt.h>
#include <tally/ledger/balance_store.hpp>
#include <tally/ledger/codespace.hpp>
#include <tally/schema/key/ledger_keys.hpp>

#include <limits>

using namespace tally::schema;

namespace tally::ledger {

balance_store::balance_store(staged_state& state, const asset_id_t& asset_id)
    : state_{state}, asset_id_{asset_id} {}

amount_t balance_store::balance(const account_id_t& holder) const {
  auto balance_key = key::make_balance_key(asset_id_, holder);
  return state_.get<amount_t>(make_bytes_view(balance_key)).value_or(0);
}

amount_t balance_store::total_supply() const {
  auto supply_key = key::make_supply_key(asset_id_);
  return state_.get<amount_t>(make_bytes_view(supply_key)).value_or(0);
}

operation_result_t balance_store::mint(const mint_capability&,
                                       const account_id_t& to,
                                       const amount_t amount) {
  auto supply = total_supply();
  if (std::numeric_limits<amount_t>::max() - amount < supply) {
    return make_error_result(ledger_error_code::capacity_exceeded,
                             "total supply would overflow", kLedgerCodespace);
  }
  auto result = credit(to, amount);
  if (!succeeded(result)) {
    return result;
  }
  auto supply_key = key::make_supply_key(asset_id_);
  state_.put(make_bytes_view(supply_key), amount_t{supply + amount});
  return result;
}

operation_result_t balance_store::transfer(const transfer_capability&,
                                           const account_id_t& from,
                                           const account_id_t& to,
                                           const amount_t amount) {
  auto result = debit(from, amount);
  if (!succeeded(result)) {
    return result;
  }
  return credit(to, amount);
}

operation_result_t balance_store::burn(const burn_capability&,
                                       const account_id_t& from,
                                       const amount_t amount) {
  auto result = debit(from, amount);
  if (!succeeded(result)) {
    return result;
  }
  auto supply_key = key::make_supply_key(asset_id_);
  auto supply = total_supply();
  if (supply < amount) {
    tally::common::critical("total supply is below a holder balance");
  }
  state_.put(make_bytes_view(supply_key), amount_t{supply - amount});
  return result;
}

operation_result_t balance_store::credit(const account_id_t& holder,
                                         const amount_t amount) {
  auto current = balance(holder);
  if (std::numeric_limits<amount_t>::max() - amount < current) {
    return make_error_result(
        ledger_error_code::capacity_exceeded,
        fmt::format("balance of {} would overflow", to_hex(holder)),
        kLedgerCodespace);
  }
  store_balance(holder, current + amount);
  return {};
}

operation_result_t balance_store::debit(const account_id_t& holder,
                                        const amount_t amount) {
  auto current = balance(holder);
  if (current < amount) {
    return make_error_result(
        ledger_error_code::insufficient_balance,
        fmt::format("{} holds {}, needs {}", to_hex(holder), current, amount),
        kLedgerCodespace);
  }
  store_balance(holder, current - amount);
  return {};
}

void balance_store::store_balance(const account_id_t& holder,
                                  const amount_t amount) {
  auto balance_key = key::make_balance_key(asset_id_, holder);
  if (amount == 0) {
    state_.erase(make_bytes_view(balance_key));
    return;
  }
  state_.put(make_bytes_view(balance_key), amount);
}

}  // namespace tally::ledger
