#pragma once

#include <custodian/common/reentrancy_lock.hpp>
#include <custodian/execution/asset_transfer_protocol.hpp>
#include <custodian/execution/deposit_pipeline.hpp>
#include <custodian/execution/exchange_adapter.hpp>
#include <custodian/execution/withdrawal_gate.hpp>
#include <custodian/ledger/ledger.hpp>
#include <custodian/schema/call_context.hpp>
#include <custodian/schema/encoding/encoder.hpp>
#include <custodian/schema/encoding/scale/encoder.hpp>
#include <custodian/schema/ledger_config.hpp>
#include <custodian/schema/ledger_info.hpp>
#include <custodian/schema/ledger_state.hpp>
#include <custodian/schema/operation_result.hpp>
#include <custodian/schema/primitives.hpp>
#include <custodian/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

namespace custodian::execution {

/// Custody ledger facade used by the RPC service.
///
/// Owns the configuration, the ledger state and the reentrancy lock, and
/// persists every successful mutation before returning it. Mutating calls run
/// against a working copy holding only the caller's entry and the totals, and
/// never block: a second mutating call while one is in flight is rejected
/// with `reentrant_call_t`. Queries read the last committed state and may run
/// while a mutation is waiting on a collaborator.
class engine final {
 public:
  using encoder_t = custodian::schema::encoding::encoder<
      custodian::schema::encoding::scale_encoder_tag>;
  using storage_t =
      custodian::storage::storage<custodian::storage::rocksdb_storage_tag>;

  /// Validate `config`, then load (or initialize) the persisted ledger.
  ///
  /// An invalid configuration, a configuration that differs from the one
  /// persisted, or persisted state failing conservation / state root checks
  /// is fatal.
  engine(encoder_t& encoder,
         storage_t& storage,
         custodian::schema::ledger_config_t config,
         exchange_adapter& exchange,
         asset_transfer_protocol& assets);

  custodian::schema::operation_result_t deposit_native(
      const custodian::schema::call_context_t& context,
      const custodian::schema::amount_t& min_proceeds);

  custodian::schema::operation_result_t deposit_asset(
      const custodian::schema::call_context_t& context,
      const custodian::schema::asset_id_t& asset,
      const custodian::schema::amount_t& amount,
      const custodian::schema::amount_t& min_proceeds);

  custodian::schema::operation_result_t withdraw(
      const custodian::schema::call_context_t& context,
      const custodian::schema::amount_t& amount);

  custodian::schema::amount_t balance_of(
      const custodian::schema::account_id_t& account) const;

  /// Aggregate custodied value; std::nullopt unless `caller` is the
  /// configured administrator.
  std::optional<custodian::schema::amount_t> aggregate_value(
      const custodian::schema::account_id_t& caller) const;

  uint64_t deposit_count() const;
  uint64_t withdrawal_count() const;
  const custodian::schema::amount_t& capacity() const;
  const custodian::schema::amount_t& withdrawal_ceiling() const;
  const custodian::schema::ledger_config_t& config() const;

  /// Counters, limits and the BLAKE3 root of the committed state.
  custodian::schema::ledger_info_t info() const;

 private:
  /// Run one mutating body under the reentrancy lock; commit and persist
  /// the working state when the body succeeds.
  template <typename Body>
  custodian::schema::operation_result_t mutate(
      std::string_view operation,
      const custodian::schema::account_id_t& account,
      Body&& body);

  /// Write the touched balance, the totals and the new state root in one
  /// batch.
  void persist(const custodian::schema::ledger_totals_t& totals,
               const custodian::schema::account_id_t& account,
               const custodian::schema::amount_t& balance,
               const custodian::schema::hash32_t& root);
  void load_persisted_state();

  /// The state root is BLAKE3 over the encoded totals and the XOR of one
  /// leaf hash per account, so a commit only rehashes the touched account.
  custodian::schema::hash32_t account_leaf(
      const custodian::schema::account_id_t& account,
      const custodian::schema::amount_t& balance) const;
  custodian::schema::hash32_t state_root(
      const custodian::schema::ledger_totals_t& totals,
      const custodian::schema::hash32_t& balances_digest) const;

  encoder_t& encoder_;
  storage_t& storage_;
  const custodian::schema::ledger_config_t config_;
  const custodian::ledger::ledger ledger_;
  deposit_pipeline deposit_pipeline_;
  withdrawal_gate withdrawal_gate_;
  custodian::common::reentrancy_lock reentrancy_lock_;
  mutable std::mutex mutex_;
  custodian::schema::ledger_state_t state_;
  custodian::schema::hash32_t balances_digest_{};
  custodian::schema::hash32_t state_root_{};
};

}  // namespace custodian::execution
