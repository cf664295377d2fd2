#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tally::common {

/// Log an unrecoverable failure, flush all sinks and terminate the process.
///
/// Used for storage and codec failures that leave the ledger in an unknown
/// state. Ledger rule violations are reported through operation results.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace tally::common
