#pragma once

#include <spdlog/spdlog.h>

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

namespace custodian::common {

/// Log an unrecoverable fault and bring the process down.
///
/// For storage and encoding failures, corrupt persisted state and a
/// configuration the ledger cannot start with. Ledger rule violations are
/// results, never faults.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::default_logger()->flush();
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Args>(args)...)});
}

}  // namespace custodian::common
