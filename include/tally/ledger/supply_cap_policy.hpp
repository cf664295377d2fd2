#pragma once
#include <tally/schema/operation_result.hpp>
#include <tally/schema/primitives.hpp>

namespace tally::ledger {

/// No holder may end an operation above `max_per_holder`.
class supply_cap_policy final {
 public:
  explicit supply_cap_policy(tally::schema::amount_t max_per_holder);

  /// Fails with capacity_exceeded when current + incoming > cap. Overflow of
  /// the sum counts as exceeding.
  tally::schema::operation_result_t check_cap(
      const tally::schema::account_id_t& holder,
      tally::schema::amount_t current_balance,
      tally::schema::amount_t incoming) const;

  tally::schema::amount_t max_per_holder() const { return max_per_holder_; }

 private:
  tally::schema::amount_t max_per_holder_;
};

}  // namespace tally::ledger
