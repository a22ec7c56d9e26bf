#pragma once

#include <custodian/schema/ledger_error_code.hpp>
#include <custodian/schema/primitives.hpp>

#include <string>
#include <variant>

// Structured failure details. Each alternative maps to exactly one
// `ledger_error_code` so callers can assert on both the code and the payload.
namespace custodian::schema {

struct zero_amount_t final {};

struct zero_proceeds_t final {};

struct capacity_exceeded_t final {
  amount_t current_total{};
  amount_t attempted{};
  amount_t limit{};
};

struct insufficient_balance_t final {
  amount_t available{};
  amount_t requested{};
};

struct withdrawal_ceiling_exceeded_t final {
  amount_t ceiling{};
  amount_t requested{};
};

struct transfer_failed_t final {
  asset_id_t asset{};
};

struct exchange_failed_t final {};

struct reentrant_call_t final {};

struct invalid_configuration_t final {
  std::string reason;
};

struct invalid_asset_t final {
  asset_id_t asset{};
};

struct unauthorized_t final {
  account_id_t caller{};
};

using ledger_error_t = std::variant<zero_amount_t,
                                    zero_proceeds_t,
                                    capacity_exceeded_t,
                                    insufficient_balance_t,
                                    withdrawal_ceiling_exceeded_t,
                                    transfer_failed_t,
                                    exchange_failed_t,
                                    reentrant_call_t,
                                    invalid_configuration_t,
                                    invalid_asset_t,
                                    unauthorized_t>;

ledger_error_code error_code(const ledger_error_t& error);

/// Human readable rendering used for result logs.
std::string describe(const ledger_error_t& error);

}  // namespace custodian::schema
