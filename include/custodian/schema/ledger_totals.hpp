#pragma once

#include <custodian/schema/primitives.hpp>
#include <cstdint>

namespace custodian::schema {

template <uint16_t Version>
struct ledger_totals;

template <>
struct ledger_totals<1> final {
  uint16_t version{1};
  amount_t aggregate_value{};
  uint64_t deposit_count{};
  uint64_t withdrawal_count{};
};

using ledger_totals_t = ledger_totals<1>;

}  // namespace custodian::schema
