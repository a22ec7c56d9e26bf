#pragma once

#include <custodian/schema/enum_names.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace custodian::schema {

enum class ledger_event_kind : uint8_t { deposit = 1, withdrawal = 2 };

template <>
struct enum_names<ledger_event_kind> final {
  static constexpr auto values = std::array{
      std::pair<std::string_view, ledger_event_kind>{
          "deposit", ledger_event_kind::deposit},
      std::pair<std::string_view, ledger_event_kind>{
          "withdrawal", ledger_event_kind::withdrawal},
  };
};

/// `indexed` marks the attributes a consumer filters on (record and account
/// ids).
struct ledger_event_attribute final {
  std::string key;
  std::string value;
  bool indexed{};
};

template <uint16_t Version>
struct ledger_event;

// One per successful deposit or withdrawal; attributes mirror the record.
template <>
struct ledger_event<1> final {
  uint16_t version{1};
  ledger_event_kind kind{ledger_event_kind::deposit};
  std::vector<ledger_event_attribute> attributes;
};

using ledger_event_t = ledger_event<1>;

inline std::optional<std::string_view> find_attribute(
    const ledger_event_t& event,
    const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return std::nullopt;
}

}  // namespace custodian::schema
