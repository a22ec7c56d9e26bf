#pragma once

#include <custodian/schema/primitives.hpp>

namespace custodian::execution {

/// Fungible-token transfer/approval protocol plus native value sends.
///
/// `pull` moves tokens on behalf of `to`, which must have been authorized by
/// `from` beforehand; the allowance is consumed by the amount pulled.
class asset_transfer_protocol {
 public:
  virtual ~asset_transfer_protocol() = default;

  virtual bool pull(const custodian::schema::asset_id_t& asset,
                    const custodian::schema::account_id_t& from,
                    const custodian::schema::account_id_t& to,
                    const custodian::schema::amount_t& amount) = 0;

  /// Set (not add to) the allowance `owner` grants `spender`.
  virtual bool authorize(const custodian::schema::asset_id_t& asset,
                         const custodian::schema::account_id_t& owner,
                         const custodian::schema::account_id_t& spender,
                         const custodian::schema::amount_t& amount) = 0;

  virtual bool transfer(const custodian::schema::asset_id_t& asset,
                        const custodian::schema::account_id_t& from,
                        const custodian::schema::account_id_t& to,
                        const custodian::schema::amount_t& amount) = 0;

  virtual custodian::schema::amount_t balance_of(
      const custodian::schema::asset_id_t& asset,
      const custodian::schema::account_id_t& holder) const = 0;

  virtual bool send_native(const custodian::schema::account_id_t& from,
                           const custodian::schema::account_id_t& to,
                           const custodian::schema::amount_t& amount) = 0;
};

}  // namespace custodian::execution
