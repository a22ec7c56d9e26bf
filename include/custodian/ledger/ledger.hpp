#pragma once

#include <custodian/schema/ledger_error.hpp>
#include <custodian/schema/ledger_state.hpp>
#include <custodian/schema/primitives.hpp>
#include <cstdint>
#include <optional>

namespace custodian::ledger {

/// Balance rules over a `ledger_state_t` owned by the caller.
///
/// Every mutator validates first and mutates second: when an error is
/// returned the state is untouched. All arithmetic is checked 256-bit.
class ledger final {
 public:
  ledger(custodian::schema::amount_t capacity_limit,
         custodian::schema::amount_t withdrawal_ceiling);

  /// Add `amount` to `user` and to the aggregate.
  ///
  /// Fails with `zero_amount_t` for zero and with `capacity_exceeded_t` when
  /// the resulting aggregate would exceed the capacity limit (or 2^256).
  std::optional<custodian::schema::ledger_error_t> credit(
      custodian::schema::ledger_state_t& state,
      const custodian::schema::account_id_t& user,
      const custodian::schema::amount_t& amount) const;

  /// Validation half of `debit`; never mutates.
  std::optional<custodian::schema::ledger_error_t> check_debit(
      const custodian::schema::ledger_state_t& state,
      const custodian::schema::account_id_t& user,
      const custodian::schema::amount_t& amount) const;

  /// Remove `amount` from `user` and from the aggregate.
  std::optional<custodian::schema::ledger_error_t> debit(
      custodian::schema::ledger_state_t& state,
      const custodian::schema::account_id_t& user,
      const custodian::schema::amount_t& amount) const;

  custodian::schema::amount_t balance_of(
      const custodian::schema::ledger_state_t& state,
      const custodian::schema::account_id_t& user) const;

  /// Bump the deposit counter; returns the new count (the deposit id).
  uint64_t record_deposit(custodian::schema::ledger_state_t& state) const;

  /// Bump the withdrawal counter; returns the new count.
  uint64_t record_withdrawal(custodian::schema::ledger_state_t& state) const;

  const custodian::schema::amount_t& capacity_limit() const;
  const custodian::schema::amount_t& withdrawal_ceiling() const;

 private:
  custodian::schema::amount_t capacity_limit_;
  custodian::schema::amount_t withdrawal_ceiling_;
};

}  // namespace custodian::ledger
