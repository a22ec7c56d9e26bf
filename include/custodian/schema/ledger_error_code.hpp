#pragma once

#include <custodian/schema/enum_names.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace custodian::schema {

/// Result codes reported by mutating ledger operations. Zero is success.
enum class ledger_error_code : uint32_t {
  zero_amount = 1,
  zero_proceeds = 2,
  capacity_exceeded = 3,
  insufficient_balance = 4,
  withdrawal_ceiling_exceeded = 5,
  transfer_failed = 6,
  exchange_failed = 7,
  reentrant_call = 8,
  invalid_configuration = 9,
  invalid_asset = 10,
  unauthorized = 11,
};

template <>
struct enum_names<ledger_error_code> final {
  static constexpr auto values = std::array{
      std::pair<std::string_view, ledger_error_code>{
          "zero_amount", ledger_error_code::zero_amount},
      std::pair<std::string_view, ledger_error_code>{
          "zero_proceeds", ledger_error_code::zero_proceeds},
      std::pair<std::string_view, ledger_error_code>{
          "capacity_exceeded", ledger_error_code::capacity_exceeded},
      std::pair<std::string_view, ledger_error_code>{
          "insufficient_balance", ledger_error_code::insufficient_balance},
      std::pair<std::string_view, ledger_error_code>{
          "withdrawal_ceiling_exceeded",
          ledger_error_code::withdrawal_ceiling_exceeded},
      std::pair<std::string_view, ledger_error_code>{
          "transfer_failed", ledger_error_code::transfer_failed},
      std::pair<std::string_view, ledger_error_code>{
          "exchange_failed", ledger_error_code::exchange_failed},
      std::pair<std::string_view, ledger_error_code>{
          "reentrant_call", ledger_error_code::reentrant_call},
      std::pair<std::string_view, ledger_error_code>{
          "invalid_configuration", ledger_error_code::invalid_configuration},
      std::pair<std::string_view, ledger_error_code>{
          "invalid_asset", ledger_error_code::invalid_asset},
      std::pair<std::string_view, ledger_error_code>{
          "unauthorized", ledger_error_code::unauthorized},
  };
};

inline constexpr std::string_view to_string(const ledger_error_code value) {
  return enum_name(value);
}

}  // namespace custodian::schema
