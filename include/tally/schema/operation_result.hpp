#pragma once

#include <tally/schema/ledger_error_code.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

// Schema type: operation result.
// Ledger workflow: Outcome envelope of every ledger call: numeric code,
// symbolic log, human-readable detail and the component that decided it.
namespace tally::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
};

using operation_result_t = operation_result<1>;

inline operation_result_t make_error_result(const ledger_error_code code,
                                             std::string info,
                                             const std::string_view codespace) {
  return operation_result_t{.code = static_cast<uint32_t>(code),
                            .log = std::string{to_string(code)},
                            .info = std::move(info),
                            .codespace = std::string{codespace}};
}

inline bool succeeded(const operation_result_t& result) {
  return result.code == 0;
}

inline ledger_error_code error_code(const operation_result_t& result) {
  return static_cast<ledger_error_code>(result.code);
}

}  // namespace tally::schema
