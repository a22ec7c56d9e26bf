#pragma once

#include <custodian/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <optional>
#include <string_view>

// Canonical key layout for the persisted ledger.
namespace custodian::schema::key {

inline constexpr std::string_view kLedgerConfigKey{"SYS|LEDGER|CONFIG"};
inline constexpr std::string_view kLedgerTotalsKey{"SYS|LEDGER|TOTALS"};
inline constexpr std::string_view kStateRootKey{"SYS|LEDGER|STATE_ROOT"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
// Last accepted request nonce per caller, for replay protection.
inline constexpr std::string_view kNonceKeyPrefix{"SYS|AUTH|NONCE|"};

template <typename Encoder, typename T>
custodian::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                             std::string_view prefix,
                                             const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
custodian::schema::bytes_t make_prefix_key(Encoder& encoder,
                                           std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
custodian::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const custodian::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix, account);
}

template <typename Encoder>
custodian::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const custodian::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, account);
}

/// Recover the account id from a key built by `make_balance_key`.
template <typename Encoder>
std::optional<custodian::schema::account_id_t> parse_balance_key(
    Encoder& encoder,
    const custodian::schema::bytes_view_t& key) {
  auto prefix = make_prefix_key(encoder, kBalanceKeyPrefix);
  auto account = custodian::schema::account_id_t{};
  if (key.size() != prefix.size() + account.size() ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  std::copy(std::begin(key) + static_cast<std::ptrdiff_t>(prefix.size()),
            std::end(key), std::begin(account));
  return account;
}

}  // namespace custodian::schema::key
