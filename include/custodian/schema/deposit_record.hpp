#pragma once

#include <custodian/schema/primitives.hpp>
#include <cstdint>

namespace custodian::schema {

template <uint16_t Version>
struct deposit_record;

/// Emitted once per successful deposit. `input_asset` is the native marker
/// (the zero id) for native-value deposits.
template <>
struct deposit_record<1> final {
  uint16_t version{1};
  uint64_t deposit_id{};
  account_id_t depositor;
  asset_id_t input_asset;
  amount_t input_amount{};
  amount_t proceeds{};
  timestamp_milliseconds_t recorded_at{};
};

using deposit_record_t = deposit_record<1>;

}  // namespace custodian::schema
