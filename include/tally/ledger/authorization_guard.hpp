#pragma once
#include <tally/ledger/capability.hpp>
#include <tally/schema/operation_result.hpp>
#include <tally/schema/primitives.hpp>
#include <functional>
#include <optional>

namespace tally::ledger {

using capability_ref_t = std::reference_wrapper<const capability_set>;

/// Gatekeeper for the asset's capabilities.
class authorization_guard final {
 public:
  authorization_guard(const tally::schema::account_id_t& administrator,
                      const capability_set& capabilities);

  /// Lend the capabilities to `caller` when it is the administrator.
  std::optional<capability_ref_t> require_admin(
      const tally::schema::account_id_t& caller) const;

  /// Standard rejection for a caller that failed require_admin.
  static tally::schema::operation_result_t permission_denied(
      const tally::schema::account_id_t& caller);

  const tally::schema::account_id_t& administrator() const {
    return administrator_;
  }

 private:
  tally::schema::account_id_t administrator_;
  const capability_set& capabilities_;
};

}  // namespace tally::ledger
