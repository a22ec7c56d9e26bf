#include <custodian/execution/proceeds_meter.hpp>

#include <utility>

namespace custodian::execution {

proceeds_meter::proceeds_meter(const asset_transfer_protocol& assets,
                               custodian::schema::asset_id_t asset,
                               custodian::schema::account_id_t holder)
    : assets_{assets},
      asset_{std::move(asset)},
      holder_{std::move(holder)},
      opening_balance_{assets_.balance_of(asset_, holder_)} {}

std::optional<custodian::schema::amount_t> proceeds_meter::measure() const {
  auto closing_balance = assets_.balance_of(asset_, holder_);
  return custodian::schema::checked_sub(closing_balance, opening_balance_);
}

const custodian::schema::amount_t& proceeds_meter::opening_balance() const {
  return opening_balance_;
}

}  // namespace custodian::execution
