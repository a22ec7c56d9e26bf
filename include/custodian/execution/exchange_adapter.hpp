#pragma once

#include <custodian/schema/primitives.hpp>
#include <optional>
#include <vector>

namespace custodian::execution {

/// One exact-input conversion into the settlement currency.
struct conversion_request final {
  custodian::schema::amount_t amount_in{};
  custodian::schema::amount_t min_amount_out{};
  /// Input asset first, settlement currency last.
  std::vector<custodian::schema::asset_id_t> path;
  /// Account the input is taken from (custody).
  custodian::schema::account_id_t payer{};
  custodian::schema::account_id_t recipient{};
  custodian::schema::timestamp_milliseconds_t deadline{};
  /// Native value attached to the call; non-zero only for native-in
  /// conversions, where it equals `amount_in`.
  custodian::schema::amount_t native_value{};
};

/// External exchange/router performing token -> settlement conversions.
///
/// A conversion is all or nothing: when std::nullopt is returned no value has
/// moved. The returned amount is informational; custody measures what it
/// actually received.
class exchange_adapter {
 public:
  virtual ~exchange_adapter() = default;

  virtual std::optional<custodian::schema::amount_t> convert_exact_input(
      const conversion_request& request) = 0;
};

}  // namespace custodian::execution
