#pragma once

#include <custodian/execution/asset_transfer_protocol.hpp>
#include <custodian/schema/primitives.hpp>
#include <map>
#include <mutex>
#include <tuple>
#include <utility>

namespace custodian::simulation {

/// In-memory fungible token balances, allowances and native balances.
///
/// Reference implementation of the transfer protocol for the sandbox daemon
/// and the tests. Every call is atomic under an internal mutex; a failed call
/// changes nothing.
class asset_book final : public custodian::execution::asset_transfer_protocol {
 public:
  bool pull(const custodian::schema::asset_id_t& asset,
            const custodian::schema::account_id_t& from,
            const custodian::schema::account_id_t& to,
            const custodian::schema::amount_t& amount) override;

  bool authorize(const custodian::schema::asset_id_t& asset,
                 const custodian::schema::account_id_t& owner,
                 const custodian::schema::account_id_t& spender,
                 const custodian::schema::amount_t& amount) override;

  bool transfer(const custodian::schema::asset_id_t& asset,
                const custodian::schema::account_id_t& from,
                const custodian::schema::account_id_t& to,
                const custodian::schema::amount_t& amount) override;

  custodian::schema::amount_t balance_of(
      const custodian::schema::asset_id_t& asset,
      const custodian::schema::account_id_t& holder) const override;

  bool send_native(const custodian::schema::account_id_t& from,
                   const custodian::schema::account_id_t& to,
                   const custodian::schema::amount_t& amount) override;

  /// Create `amount` of `asset` out of thin air for `holder`.
  bool mint(const custodian::schema::asset_id_t& asset,
            const custodian::schema::account_id_t& holder,
            const custodian::schema::amount_t& amount);

  bool mint_native(const custodian::schema::account_id_t& holder,
                   const custodian::schema::amount_t& amount);

  custodian::schema::amount_t native_balance_of(
      const custodian::schema::account_id_t& holder) const;

  custodian::schema::amount_t allowance(
      const custodian::schema::asset_id_t& asset,
      const custodian::schema::account_id_t& owner,
      const custodian::schema::account_id_t& spender) const;

 private:
  using holding_key_t = std::pair<custodian::schema::asset_id_t,
                                  custodian::schema::account_id_t>;
  using allowance_key_t = std::tuple<custodian::schema::asset_id_t,
                                     custodian::schema::account_id_t,
                                     custodian::schema::account_id_t>;

  /// Move between two entries of `table`; caller holds `mutex_`.
  template <typename Table, typename Key>
  static bool move_locked(Table& table,
                          const Key& from,
                          const Key& to,
                          const custodian::schema::amount_t& amount);

  mutable std::mutex mutex_;
  std::map<holding_key_t, custodian::schema::amount_t> holdings_;
  std::map<allowance_key_t, custodian::schema::amount_t> allowances_;
  std::map<custodian::schema::account_id_t, custodian::schema::amount_t>
      native_;
};

}  // namespace custodian::simulation
