#include <spdlog/fmt/fmt.h>
#include <tally/ledger/codespace.hpp>
#include <tally/ledger/supply_cap_policy.hpp>

using namespace tally::schema;

namespace tally::ledger {

supply_cap_policy::supply_cap_policy(const amount_t max_per_holder)
    : max_per_holder_{max_per_holder} {}

operation_result_t supply_cap_policy::check_cap(const account_id_t& holder,
                                                const amount_t current_balance,
                                                const amount_t incoming) const {
  if (current_balance > max_per_holder_ ||
      incoming > max_per_holder_ - current_balance) {
    return make_error_result(
        ledger_error_code::capacity_exceeded,
        fmt::format("{} would hold more than {} (current {}, incoming {})",
                    to_hex(holder), max_per_holder_, current_balance,
                    incoming),
        kLedgerCodespace);
  }
  return {};
}

}  // namespace tally::ledger
