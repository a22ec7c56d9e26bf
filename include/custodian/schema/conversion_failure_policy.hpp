#pragma once

#include <custodian/schema/enum_names.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace custodian::schema {

/// What happens to value already pulled into custody when a token deposit
/// fails after the pull (exchange failure, zero proceeds, capacity).
///
/// `retain_in_custody` leaves the tokens (or the converted proceeds) held by
/// custody and uncredited. `refund_caller` sends them back to the depositor.
/// The native path always refunds and is not governed by this setting.
enum class conversion_failure_policy_t : uint8_t {
  retain_in_custody = 0,
  refund_caller = 1
};

template <>
struct enum_names<conversion_failure_policy_t> final {
  static constexpr auto values = std::array{
      std::pair<std::string_view, conversion_failure_policy_t>{
          "retain", conversion_failure_policy_t::retain_in_custody},
      std::pair<std::string_view, conversion_failure_policy_t>{
          "refund", conversion_failure_policy_t::refund_caller},
  };
};

inline constexpr std::string_view to_string(
    const conversion_failure_policy_t value) {
  return enum_name(value);
}

}  // namespace custodian::schema
