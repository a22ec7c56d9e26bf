#include <spdlog/spdlog.h>
#include <custodian/execution/deposit_pipeline.hpp>
#include <custodian/execution/proceeds_meter.hpp>
#include <custodian/execution/result.hpp>

#include <algorithm>
#include <limits>
#include <utility>

using namespace custodian::schema;

namespace custodian::execution {

deposit_pipeline::deposit_pipeline(const ledger_config_t& config,
                                   const custodian::ledger::ledger& ledger,
                                   exchange_adapter& exchange,
                                   asset_transfer_protocol& assets)
    : config_{config}, ledger_{ledger}, exchange_{exchange}, assets_{assets} {}

timestamp_milliseconds_t deposit_pipeline::deadline(
    const call_context_t& context) const {
  constexpr auto kMax = std::numeric_limits<timestamp_milliseconds_t>::max();
  if (context.timestamp > kMax - config_.conversion_deadline_window) {
    return kMax;
  }
  return context.timestamp + config_.conversion_deadline_window;
}

// A conversion that delivers nothing must fail inside the exchange, so the
// floor is never below one unit of settlement currency.
amount_t deposit_pipeline::minimum_output(const amount_t& min_proceeds) {
  return std::max(min_proceeds, amount_t{1});
}

template <typename OnRejected>
operation_result_t deposit_pipeline::credit_proceeds(
    ledger_state_t& state,
    const call_context_t& context,
    const asset_id_t& input_asset,
    const amount_t& input_amount,
    const amount_t& proceeds,
    OnRejected&& on_rejected) {
  if (auto error = ledger_.credit(state, context.caller, proceeds)) {
    return std::forward<OnRejected>(on_rejected)(*error);
  }

  auto record = deposit_record_t{};
  record.deposit_id = ledger_.record_deposit(state);
  record.depositor = context.caller;
  record.input_asset = input_asset;
  record.input_amount = input_amount;
  record.proceeds = proceeds;
  record.recorded_at = context.timestamp;

  spdlog::info("Deposit {} credited {} to {} (input {} of {})",
               record.deposit_id, to_string(proceeds), to_hex(context.caller),
               to_string(input_amount), to_hex(input_asset));
  return make_deposit_result(record);
}

operation_result_t deposit_pipeline::deposit_native(
    ledger_state_t& state,
    const call_context_t& context,
    const amount_t& min_proceeds) {
  const auto native_marker = make_zero_hash();
  if (context.value == 0) {
    return make_error_result(zero_amount_t{}, kDepositCodespace);
  }

  auto meter = proceeds_meter{assets_, config_.settlement_asset,
                              config_.custody_account};
  auto request = conversion_request{};
  request.amount_in = context.value;
  request.min_amount_out = minimum_output(min_proceeds);
  request.path = {config_.native_wrapper_asset, config_.settlement_asset};
  request.payer = config_.custody_account;
  request.recipient = config_.custody_account;
  request.deadline = deadline(context);
  request.native_value = context.value;

  auto converted = exchange_.convert_exact_input(request);
  if (!converted) {
    spdlog::warn("Native conversion of {} for {} failed; refunding",
                 to_string(context.value), to_hex(context.caller));
    return refund_native(context, exchange_failed_t{});
  }

  auto proceeds = meter.measure();
  if (!proceeds || *proceeds == 0) {
    spdlog::warn("Native conversion of {} for {} delivered nothing; refunding",
                 to_string(context.value), to_hex(context.caller));
    return refund_native(context, zero_proceeds_t{});
  }
  if (*proceeds != *converted) {
    spdlog::warn("Exchange reported {} but custody received {}",
                 to_string(*converted), to_string(*proceeds));
  }

  return credit_proceeds(
      state, context, native_marker, context.value, *proceeds,
      [&](const ledger_error_t& error) {
        // The native value is gone into the exchange; the caller gets the
        // settlement currency it bought instead.
        if (!assets_.transfer(config_.settlement_asset, config_.custody_account,
                              context.caller, *proceeds)) {
          spdlog::error("Returning {} settlement proceeds to {} failed",
                        to_string(*proceeds), to_hex(context.caller));
          return make_error_result(
              transfer_failed_t{.asset = config_.settlement_asset},
              kDepositCodespace);
        }
        return make_error_result(error, kDepositCodespace);
      });
}

operation_result_t deposit_pipeline::deposit_asset(
    ledger_state_t& state,
    const call_context_t& context,
    const asset_id_t& asset,
    const amount_t& amount,
    const amount_t& min_proceeds) {
  if (amount == 0) {
    return make_error_result(zero_amount_t{}, kDepositCodespace);
  }
  if (is_zero(asset)) {
    return make_error_result(invalid_asset_t{.asset = asset},
                             kDepositCodespace);
  }

  if (asset == config_.settlement_asset) {
    auto meter = proceeds_meter{assets_, config_.settlement_asset,
                                config_.custody_account};
    if (!assets_.pull(asset, context.caller, config_.custody_account, amount)) {
      return make_error_result(transfer_failed_t{.asset = asset},
                               kDepositCodespace);
    }
    auto proceeds = meter.measure();
    if (!proceeds || *proceeds == 0) {
      return make_error_result(zero_proceeds_t{}, kDepositCodespace);
    }
    return credit_proceeds(state, context, asset, amount, *proceeds,
                           [&](const ledger_error_t& error) {
                             return reject_token_deposit(
                                 context, config_.settlement_asset, *proceeds,
                                 error);
                           });
  }

  if (!assets_.pull(asset, context.caller, config_.custody_account, amount)) {
    return make_error_result(transfer_failed_t{.asset = asset},
                             kDepositCodespace);
  }

  if (!assets_.authorize(asset, config_.custody_account,
                         config_.exchange_adapter, amount)) {
    return reject_token_deposit(context, asset, amount,
                                transfer_failed_t{.asset = asset});
  }

  auto meter = proceeds_meter{assets_, config_.settlement_asset,
                              config_.custody_account};
  const auto held_before = assets_.balance_of(asset, config_.custody_account);
  auto request = conversion_request{};
  request.amount_in = amount;
  request.min_amount_out = minimum_output(min_proceeds);
  request.path = {asset, config_.settlement_asset};
  request.payer = config_.custody_account;
  request.recipient = config_.custody_account;
  request.deadline = deadline(context);

  auto converted = exchange_.convert_exact_input(request);
  // Whatever the exchange did not pull stays authorized until reset.
  if (!assets_.authorize(asset, config_.custody_account,
                         config_.exchange_adapter, amount_t{0})) {
    spdlog::warn("Failed to reset exchange allowance for asset {}",
                 to_hex(asset));
  }
  if (!converted) {
    spdlog::warn("Conversion of {} {} for {} failed", to_string(amount),
                 to_hex(asset), to_hex(context.caller));
    return reject_token_deposit(context, asset, amount, exchange_failed_t{});
  }

  auto proceeds = meter.measure();
  if (!proceeds || *proceeds == 0) {
    // Only the part of the deposit the exchange left behind can be refunded.
    auto held_after = assets_.balance_of(asset, config_.custody_account);
    auto consumed = checked_sub(held_before, held_after).value_or(amount_t{0});
    auto remaining =
        consumed >= amount ? amount_t{0} : amount_t{amount - consumed};
    spdlog::warn("Conversion of {} {} for {} delivered nothing",
                 to_string(amount), to_hex(asset), to_hex(context.caller));
    if (remaining == 0) {
      return make_error_result(zero_proceeds_t{}, kDepositCodespace);
    }
    return reject_token_deposit(context, asset, remaining, zero_proceeds_t{});
  }
  if (*proceeds != *converted) {
    spdlog::warn("Exchange reported {} but custody received {}",
                 to_string(*converted), to_string(*proceeds));
  }

  return credit_proceeds(state, context, asset, amount, *proceeds,
                         [&](const ledger_error_t& error) {
                           return reject_token_deposit(
                               context, config_.settlement_asset, *proceeds,
                               error);
                         });
}

operation_result_t deposit_pipeline::refund_native(
    const call_context_t& context,
    const ledger_error_t& error) {
  if (!assets_.send_native(config_.custody_account, context.caller,
                           context.value)) {
    spdlog::error("Native refund of {} to {} failed", to_string(context.value),
                  to_hex(context.caller));
    return make_error_result(transfer_failed_t{.asset = make_zero_hash()},
                             kDepositCodespace);
  }
  return make_error_result(error, kDepositCodespace);
}

operation_result_t deposit_pipeline::reject_token_deposit(
    const call_context_t& context,
    const asset_id_t& held_asset,
    const amount_t& held_amount,
    const ledger_error_t& error) {
  if (config_.failure_policy ==
      conversion_failure_policy_t::retain_in_custody) {
    spdlog::warn("Deposit by {} rejected ({}); {} of {} retained in custody",
                 to_hex(context.caller), describe(error),
                 to_string(held_amount), to_hex(held_asset));
    return make_error_result(error, kDepositCodespace);
  }

  if (!assets_.transfer(held_asset, config_.custody_account, context.caller,
                        held_amount)) {
    spdlog::error("Refund of {} of {} to {} failed", to_string(held_amount),
                  to_hex(held_asset), to_hex(context.caller));
    return make_error_result(transfer_failed_t{.asset = held_asset},
                             kDepositCodespace);
  }
  spdlog::warn("Deposit by {} rejected ({}); refunded {} of {}",
               to_hex(context.caller), describe(error), to_string(held_amount),
               to_hex(held_asset));
  return make_error_result(error, kDepositCodespace);
}

}  // namespace custodian::execution
