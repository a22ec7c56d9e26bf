#pragma once

#include <custodian/execution/asset_transfer_protocol.hpp>
#include <custodian/schema/primitives.hpp>
#include <optional>

namespace custodian::execution {

/// Before/after balance measurement of what a holder actually received.
///
/// Construction reads the opening balance; `measure()` reads the closing
/// balance and returns the increase. Adapter return values are never
/// trusted for crediting.
class proceeds_meter final {
 public:
  proceeds_meter(const asset_transfer_protocol& assets,
                 custodian::schema::asset_id_t asset,
                 custodian::schema::account_id_t holder);

  /// Increase since construction; std::nullopt if the balance went down.
  std::optional<custodian::schema::amount_t> measure() const;

  const custodian::schema::amount_t& opening_balance() const;

 private:
  const asset_transfer_protocol& assets_;
  custodian::schema::asset_id_t asset_;
  custodian::schema::account_id_t holder_;
  custodian::schema::amount_t opening_balance_;
};

}  // namespace custodian::execution
