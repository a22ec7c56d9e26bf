#pragma once

#include <custodian/schema/primitives.hpp>
#include <cstdint>

namespace custodian::schema {

template <uint16_t Version>
struct withdrawal_record;

template <>
struct withdrawal_record<1> final {
  uint16_t version{1};
  uint64_t withdrawal_id{};
  account_id_t recipient;
  amount_t amount{};
  amount_t remaining_balance{};
  timestamp_milliseconds_t recorded_at{};
};

using withdrawal_record_t = withdrawal_record<1>;

}  // namespace custodian::schema
