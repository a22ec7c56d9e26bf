#pragma once

#include <custodian/schema/conversion_failure_policy.hpp>
#include <custodian/schema/primitives.hpp>
#include <cstdint>

namespace custodian::schema {

template <uint16_t Version>
struct ledger_config;

/// Immutable ledger configuration, fixed at construction.
///
/// Amounts are settlement-currency base units. Every identity must be
/// non-zero and the settlement currency must differ from the native wrapper.
template <>
struct ledger_config<1> final {
  uint16_t version{1};
  account_id_t custody_account;
  account_id_t administrator;
  asset_id_t settlement_asset;
  asset_id_t native_wrapper_asset;
  account_id_t exchange_adapter;
  amount_t capacity_limit{};
  amount_t withdrawal_ceiling{};
  duration_milliseconds_t conversion_deadline_window{300'000};
  conversion_failure_policy_t failure_policy{
      conversion_failure_policy_t::retain_in_custody};
};

using ledger_config_t = ledger_config<1>;

}  // namespace custodian::schema
