#include <custodian/schema/ledger_error.hpp>

#include <spdlog/fmt/fmt.h>

namespace custodian::schema {

ledger_error_code error_code(const ledger_error_t& error) {
  return std::visit(
      overloaded{
          [](const zero_amount_t&) { return ledger_error_code::zero_amount; },
          [](const zero_proceeds_t&) {
            return ledger_error_code::zero_proceeds;
          },
          [](const capacity_exceeded_t&) {
            return ledger_error_code::capacity_exceeded;
          },
          [](const insufficient_balance_t&) {
            return ledger_error_code::insufficient_balance;
          },
          [](const withdrawal_ceiling_exceeded_t&) {
            return ledger_error_code::withdrawal_ceiling_exceeded;
          },
          [](const transfer_failed_t&) {
            return ledger_error_code::transfer_failed;
          },
          [](const exchange_failed_t&) {
            return ledger_error_code::exchange_failed;
          },
          [](const reentrant_call_t&) {
            return ledger_error_code::reentrant_call;
          },
          [](const invalid_configuration_t&) {
            return ledger_error_code::invalid_configuration;
          },
          [](const invalid_asset_t&) {
            return ledger_error_code::invalid_asset;
          },
          [](const unauthorized_t&) {
            return ledger_error_code::unauthorized;
          }},
      error);
}

std::string describe(const ledger_error_t& error) {
  return std::visit(
      overloaded{
          [](const zero_amount_t&) {
            return std::string{"amount must be greater than zero"};
          },
          [](const zero_proceeds_t&) {
            return std::string{"conversion produced no settlement currency"};
          },
          [](const capacity_exceeded_t& value) {
            return fmt::format(
                "capacity exceeded: current={} attempted={} limit={}",
                to_string(value.current_total), to_string(value.attempted),
                to_string(value.limit));
          },
          [](const insufficient_balance_t& value) {
            return fmt::format("insufficient balance: available={} requested={}",
                               to_string(value.available),
                               to_string(value.requested));
          },
          [](const withdrawal_ceiling_exceeded_t& value) {
            return fmt::format(
                "withdrawal ceiling exceeded: ceiling={} requested={}",
                to_string(value.ceiling), to_string(value.requested));
          },
          [](const transfer_failed_t& value) {
            return fmt::format("transfer failed for asset {}",
                               to_hex(value.asset));
          },
          [](const exchange_failed_t&) {
            return std::string{"exchange conversion failed"};
          },
          [](const reentrant_call_t&) {
            return std::string{"reentrant call rejected"};
          },
          [](const invalid_configuration_t& value) {
            return fmt::format("invalid configuration: {}", value.reason);
          },
          [](const invalid_asset_t& value) {
            return fmt::format("invalid asset {}", to_hex(value.asset));
          },
          [](const unauthorized_t& value) {
            return fmt::format("caller {} is not authorized",
                               to_hex(value.caller));
          }},
      error);
}

}  // namespace custodian::schema
