#pragma once

#include <custodian/common/clock.hpp>
#include <custodian/execution/asset_transfer_protocol.hpp>
#include <custodian/execution/exchange_adapter.hpp>
#include <custodian/schema/primitives.hpp>
#include <map>
#include <optional>

namespace custodian::simulation {

/// Exchange that converts at configured fixed rates out of its own
/// settlement-currency reserve.
///
/// The request is fully validated (path, deadline, rate, minimum output,
/// reserve) before anything moves. The input is taken from the payer (token
/// allowance or native send) and the output paid from the reserve; a failed
/// payout hands the input back.
class fixed_rate_exchange final : public custodian::execution::exchange_adapter {
 public:
  fixed_rate_exchange(custodian::schema::account_id_t account,
                      custodian::schema::asset_id_t settlement_asset,
                      custodian::schema::asset_id_t native_wrapper_asset,
                      custodian::execution::asset_transfer_protocol& assets,
                      custodian::common::clock_function_t clock);

  /// Settlement units paid per `denominator` units of `asset`. Not
  /// synchronized; configure before serving.
  bool set_rate(const custodian::schema::asset_id_t& asset,
                custodian::schema::amount_t numerator,
                custodian::schema::amount_t denominator);

  /// Output for `amount_in` of `asset`, rounded down.
  std::optional<custodian::schema::amount_t> quote(
      const custodian::schema::asset_id_t& asset,
      const custodian::schema::amount_t& amount_in) const;

  std::optional<custodian::schema::amount_t> convert_exact_input(
      const custodian::execution::conversion_request& request) override;

  const custodian::schema::account_id_t& account() const;

 private:
  struct rate final {
    custodian::schema::amount_t numerator{};
    custodian::schema::amount_t denominator{1};
  };

  bool take_input(const custodian::execution::conversion_request& request,
                  bool native);
  void return_input(const custodian::execution::conversion_request& request,
                    bool native);

  custodian::schema::account_id_t account_;
  custodian::schema::asset_id_t settlement_asset_;
  custodian::schema::asset_id_t native_wrapper_asset_;
  custodian::execution::asset_transfer_protocol& assets_;
  custodian::common::clock_function_t clock_;
  std::map<custodian::schema::asset_id_t, rate> rates_;
};

}  // namespace custodian::simulation
