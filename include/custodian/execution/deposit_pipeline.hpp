#pragma once

#include <custodian/execution/asset_transfer_protocol.hpp>
#include <custodian/execution/exchange_adapter.hpp>
#include <custodian/ledger/ledger.hpp>
#include <custodian/schema/call_context.hpp>
#include <custodian/schema/ledger_config.hpp>
#include <custodian/schema/ledger_state.hpp>
#include <custodian/schema/operation_result.hpp>

namespace custodian::execution {

/// Receive value, convert it into the settlement currency, measure what
/// arrived, and credit the depositor.
///
/// Validation and the external conversion run before any ledger mutation;
/// the ledger is mutated before any further external call. The caller is
/// responsible for holding the reentrancy lock around both entry points.
class deposit_pipeline final {
 public:
  deposit_pipeline(const custodian::schema::ledger_config_t& config,
                   const custodian::ledger::ledger& ledger,
                   exchange_adapter& exchange,
                   asset_transfer_protocol& assets);

  /// Native path. `context.value` has already been moved into custody by the
  /// host. A failed conversion, or one that delivers nothing, sends the full
  /// native value back.
  custodian::schema::operation_result_t deposit_native(
      custodian::schema::ledger_state_t& state,
      const custodian::schema::call_context_t& context,
      const custodian::schema::amount_t& min_proceeds);

  /// Token path. Pulls `amount` of `asset` from the caller first; depositing
  /// the settlement currency itself skips conversion. Failures after the
  /// pull follow the configured `conversion_failure_policy_t`.
  custodian::schema::operation_result_t deposit_asset(
      custodian::schema::ledger_state_t& state,
      const custodian::schema::call_context_t& context,
      const custodian::schema::asset_id_t& asset,
      const custodian::schema::amount_t& amount,
      const custodian::schema::amount_t& min_proceeds);

 private:
  custodian::schema::timestamp_milliseconds_t deadline(
      const custodian::schema::call_context_t& context) const;

  static custodian::schema::amount_t minimum_output(
      const custodian::schema::amount_t& min_proceeds);

  /// Send the full native value back to the caller, then report `error`.
  custodian::schema::operation_result_t refund_native(
      const custodian::schema::call_context_t& context,
      const custodian::schema::ledger_error_t& error);

  /// Credit measured proceeds and emit the deposit record. On a ledger
  /// rejection `on_rejected` decides what happens to the proceeds.
  template <typename OnRejected>
  custodian::schema::operation_result_t credit_proceeds(
      custodian::schema::ledger_state_t& state,
      const custodian::schema::call_context_t& context,
      const custodian::schema::asset_id_t& input_asset,
      const custodian::schema::amount_t& input_amount,
      const custodian::schema::amount_t& proceeds,
      OnRejected&& on_rejected);

  /// Apply the token-path failure policy to value already in custody, then
  /// report `error` (or `transfer_failed_t` if the refund itself failed).
  custodian::schema::operation_result_t reject_token_deposit(
      const custodian::schema::call_context_t& context,
      const custodian::schema::asset_id_t& held_asset,
      const custodian::schema::amount_t& held_amount,
      const custodian::schema::ledger_error_t& error);

  const custodian::schema::ledger_config_t& config_;
  const custodian::ledger::ledger& ledger_;
  exchange_adapter& exchange_;
  asset_transfer_protocol& assets_;
};

}  // namespace custodian::execution
