#pragma once

#include <custodian/schema/ledger_totals.hpp>
#include <custodian/schema/primitives.hpp>
#include <map>

namespace custodian::schema {

/// In-memory ledger: one balance per account plus the aggregate counters.
///
/// Conservation: `totals.aggregate_value` equals the sum of `balances`.
/// Entries are created on first credit and never erased.
struct ledger_state final {
  std::map<account_id_t, amount_t> balances;
  ledger_totals_t totals;
};

using ledger_state_t = ledger_state;

}  // namespace custodian::schema
