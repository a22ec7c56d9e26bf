#pragma once

#include <custodian/schema/deposit_record.hpp>
#include <custodian/schema/ledger_error.hpp>
#include <custodian/schema/primitives.hpp>
#include <custodian/schema/ledger_event.hpp>
#include <custodian/schema/withdrawal_record.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace custodian::schema {

template <uint16_t Version>
struct operation_result;

/// Outcome of one mutating entry point.
///
/// `code` is zero on success, otherwise the numeric `ledger_error_code`, and
/// `error` carries the structured detail. A failed operation never carries a
/// record or events.
template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<ledger_error_t> error;
  std::optional<deposit_record_t> deposit;
  std::optional<withdrawal_record_t> withdrawal;
  std::vector<ledger_event_t> events;
};

using operation_result_t = operation_result<1>;

inline bool succeeded(const operation_result_t& result) {
  return result.code == 0;
}

}  // namespace custodian::schema
