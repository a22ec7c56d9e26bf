#pragma once

#include <custodian/execution/asset_transfer_protocol.hpp>
#include <custodian/ledger/ledger.hpp>
#include <custodian/schema/call_context.hpp>
#include <custodian/schema/ledger_config.hpp>
#include <custodian/schema/ledger_state.hpp>
#include <custodian/schema/operation_result.hpp>

namespace custodian::execution {

/// Pay settlement currency out of custody against a depositor's balance.
///
/// The balance is debited before the outbound transfer. If the transfer
/// fails the debit is rolled back and `transfer_failed_t` is reported.
class withdrawal_gate final {
 public:
  withdrawal_gate(const custodian::schema::ledger_config_t& config,
                  const custodian::ledger::ledger& ledger,
                  asset_transfer_protocol& assets);

  custodian::schema::operation_result_t withdraw(
      custodian::schema::ledger_state_t& state,
      const custodian::schema::call_context_t& context,
      const custodian::schema::amount_t& amount);

 private:
  const custodian::schema::ledger_config_t& config_;
  const custodian::ledger::ledger& ledger_;
  asset_transfer_protocol& assets_;
};

}  // namespace custodian::execution
