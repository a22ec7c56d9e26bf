#include <custodian/execution/result.hpp>

#include <string>
#include <utility>

using namespace custodian::schema;

namespace custodian::execution {

namespace {

ledger_event_attribute make_attribute(std::string key,
                                      std::string value,
                                      const bool indexed = false) {
  return ledger_event_attribute{
      .key = std::move(key), .value = std::move(value), .indexed = indexed};
}

}  // namespace

operation_result_t make_error_result(const ledger_error_t& error,
                                     std::string_view codespace) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(error_code(error));
  result.log = describe(error);
  result.codespace = std::string{codespace};
  result.error = error;
  return result;
}

operation_result_t make_deposit_result(const deposit_record_t& record) {
  auto event = ledger_event_t{};
  event.kind = ledger_event_kind::deposit;
  event.attributes.push_back(
      make_attribute("deposit_id", std::to_string(record.deposit_id), true));
  event.attributes.push_back(
      make_attribute("depositor", to_hex(record.depositor), true));
  event.attributes.push_back(
      make_attribute("input_asset", to_hex(record.input_asset)));
  event.attributes.push_back(
      make_attribute("input_amount", to_string(record.input_amount)));
  event.attributes.push_back(
      make_attribute("proceeds", to_string(record.proceeds)));

  auto result = operation_result_t{};
  result.codespace = std::string{kDepositCodespace};
  result.deposit = record;
  result.events.push_back(std::move(event));
  return result;
}

operation_result_t make_withdrawal_result(const withdrawal_record_t& record) {
  auto event = ledger_event_t{};
  event.kind = ledger_event_kind::withdrawal;
  event.attributes.push_back(make_attribute(
      "withdrawal_id", std::to_string(record.withdrawal_id), true));
  event.attributes.push_back(
      make_attribute("recipient", to_hex(record.recipient), true));
  event.attributes.push_back(make_attribute("amount", to_string(record.amount)));
  event.attributes.push_back(make_attribute(
      "remaining_balance", to_string(record.remaining_balance)));

  auto result = operation_result_t{};
  result.codespace = std::string{kWithdrawCodespace};
  result.withdrawal = record;
  result.events.push_back(std::move(event));
  return result;
}

}  // namespace custodian::execution
