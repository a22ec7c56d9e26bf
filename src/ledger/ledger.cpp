#include <custodian/common/critical.hpp>
#include <custodian/ledger/ledger.hpp>

#include <utility>

using namespace custodian::schema;

namespace custodian::ledger {

ledger::ledger(amount_t capacity_limit, amount_t withdrawal_ceiling)
    : capacity_limit_{std::move(capacity_limit)},
      withdrawal_ceiling_{std::move(withdrawal_ceiling)} {}

std::optional<ledger_error_t> ledger::credit(ledger_state_t& state,
                                             const account_id_t& user,
                                             const amount_t& amount) const {
  if (amount == 0) {
    return zero_amount_t{};
  }

  auto new_total = checked_add(state.totals.aggregate_value, amount);
  if (!new_total || *new_total > capacity_limit_) {
    return capacity_exceeded_t{.current_total = state.totals.aggregate_value,
                               .attempted = amount,
                               .limit = capacity_limit_};
  }

  // A single balance never exceeds the aggregate, so this cannot overflow
  // once the aggregate check above has passed.
  auto new_balance = checked_add(balance_of(state, user), amount);
  if (!new_balance) {
    custodian::common::critical("ledger conservation violated on credit");
  }

  state.balances[user] = *new_balance;
  state.totals.aggregate_value = *new_total;
  return std::nullopt;
}

std::optional<ledger_error_t> ledger::check_debit(const ledger_state_t& state,
                                                  const account_id_t& user,
                                                  const amount_t& amount) const {
  if (amount == 0) {
    return zero_amount_t{};
  }
  if (amount > withdrawal_ceiling_) {
    return withdrawal_ceiling_exceeded_t{.ceiling = withdrawal_ceiling_,
                                         .requested = amount};
  }
  auto available = balance_of(state, user);
  if (amount > available) {
    return insufficient_balance_t{.available = available, .requested = amount};
  }
  return std::nullopt;
}

std::optional<ledger_error_t> ledger::debit(ledger_state_t& state,
                                            const account_id_t& user,
                                            const amount_t& amount) const {
  if (auto error = check_debit(state, user, amount)) {
    return error;
  }

  auto new_balance = checked_sub(balance_of(state, user), amount);
  auto new_total = checked_sub(state.totals.aggregate_value, amount);
  if (!new_balance || !new_total) {
    custodian::common::critical("ledger conservation violated on debit");
  }

  state.balances[user] = *new_balance;
  state.totals.aggregate_value = *new_total;
  return std::nullopt;
}

amount_t ledger::balance_of(const ledger_state_t& state,
                            const account_id_t& user) const {
  auto it = state.balances.find(user);
  if (it == std::end(state.balances)) {
    return amount_t{0};
  }
  return it->second;
}

uint64_t ledger::record_deposit(ledger_state_t& state) const {
  return ++state.totals.deposit_count;
}

uint64_t ledger::record_withdrawal(ledger_state_t& state) const {
  return ++state.totals.withdrawal_count;
}

const amount_t& ledger::capacity_limit() const {
  return capacity_limit_;
}

const amount_t& ledger::withdrawal_ceiling() const {
  return withdrawal_ceiling_;
}

}  // namespace custodian::ledger
