#include <spdlog/fmt/fmt.h>
#include <tally/ledger/authorization_guard.hpp>
#include <tally/ledger/codespace.hpp>

using namespace tally::schema;

namespace tally::ledger {

authorization_guard::authorization_guard(const account_id_t& administrator,
                                         const capability_set& capabilities)
    : administrator_{administrator}, capabilities_{capabilities} {}

std::optional<capability_ref_t> authorization_guard::require_admin(
    const account_id_t& caller) const {
  if (caller != administrator_) {
    return std::nullopt;
  }
  return std::cref(capabilities_);
}

operation_result_t authorization_guard::permission_denied(
    const account_id_t& caller) {
  return make_error_result(
      ledger_error_code::permission_denied,
      fmt::format("{} is not the asset administrator", to_hex(caller)),
      kAuthCodespace);
}

}  // namespace tally::ledger
