#include <spdlog/spdlog.h>
#include <custodian/execution/result.hpp>
#include <custodian/execution/withdrawal_gate.hpp>

using namespace custodian::schema;

namespace custodian::execution {

withdrawal_gate::withdrawal_gate(const ledger_config_t& config,
                                 const custodian::ledger::ledger& ledger,
                                 asset_transfer_protocol& assets)
    : config_{config}, ledger_{ledger}, assets_{assets} {}

operation_result_t withdrawal_gate::withdraw(ledger_state_t& state,
                                             const call_context_t& context,
                                             const amount_t& amount) {
  if (auto error = ledger_.check_debit(state, context.caller, amount)) {
    spdlog::warn("Withdrawal of {} by {} rejected: {}", to_string(amount),
                 to_hex(context.caller), describe(*error));
    return make_error_result(*error, kWithdrawCodespace);
  }

  auto previous_balance = ledger_.balance_of(state, context.caller);
  auto previous_aggregate = state.totals.aggregate_value;
  if (auto error = ledger_.debit(state, context.caller, amount)) {
    return make_error_result(*error, kWithdrawCodespace);
  }

  if (!assets_.transfer(config_.settlement_asset, config_.custody_account,
                        context.caller, amount)) {
    spdlog::error("Withdrawal transfer of {} to {} failed; restoring balance",
                  to_string(amount), to_hex(context.caller));
    state.balances[context.caller] = previous_balance;
    state.totals.aggregate_value = previous_aggregate;
    return make_error_result(transfer_failed_t{.asset = config_.settlement_asset},
                             kWithdrawCodespace);
  }

  auto record = withdrawal_record_t{};
  record.withdrawal_id = ledger_.record_withdrawal(state);
  record.recipient = context.caller;
  record.amount = amount;
  record.remaining_balance = ledger_.balance_of(state, context.caller);
  record.recorded_at = context.timestamp;

  spdlog::info("Withdrawal {} paid {} to {} (remaining {})",
               record.withdrawal_id, to_string(amount), to_hex(context.caller),
               to_string(record.remaining_balance));
  return make_withdrawal_result(record);
}

}  // namespace custodian::execution
