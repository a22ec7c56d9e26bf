#pragma once

#include <custodian/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace custodian::schema {

template <uint16_t Version>
struct ledger_info;

template <>
struct ledger_info<1> final {
  uint16_t schema_version{1};
  std::string data{"custodian-ledger"};
  std::string version{"0.1.0"};
  uint64_t deposit_count{};
  uint64_t withdrawal_count{};
  amount_t capacity_limit{};
  amount_t withdrawal_ceiling{};
  hash32_t state_root;
};

using ledger_info_t = ledger_info<1>;

}  // namespace custodian::schema
