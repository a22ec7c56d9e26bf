#pragma once

#include <custodian/schema/deposit_record.hpp>
#include <custodian/schema/ledger_error.hpp>
#include <custodian/schema/operation_result.hpp>
#include <custodian/schema/ledger_event.hpp>
#include <custodian/schema/withdrawal_record.hpp>
#include <string_view>

namespace custodian::execution {

inline constexpr std::string_view kDepositCodespace{"custodian.deposit"};
inline constexpr std::string_view kWithdrawCodespace{"custodian.withdraw"};
inline constexpr std::string_view kEngineCodespace{"custodian.engine"};

custodian::schema::operation_result_t make_error_result(
    const custodian::schema::ledger_error_t& error,
    std::string_view codespace);

custodian::schema::operation_result_t make_deposit_result(
    const custodian::schema::deposit_record_t& record);

custodian::schema::operation_result_t make_withdrawal_result(
    const custodian::schema::withdrawal_record_t& record);

}  // namespace custodian::execution
