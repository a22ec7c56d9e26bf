#include <spdlog/spdlog.h>
#include <custodian/simulation/asset_book.hpp>

using namespace custodian::schema;

namespace custodian::simulation {

namespace {

template <typename Table, typename Key>
amount_t lookup(const Table& table, const Key& key) {
  auto it = table.find(key);
  return it == std::end(table) ? amount_t{0} : it->second;
}

}  // namespace

template <typename Table, typename Key>
bool asset_book::move_locked(Table& table,
                             const Key& from,
                             const Key& to,
                             const amount_t& amount) {
  auto remaining = checked_sub(lookup(table, from), amount);
  if (!remaining) {
    return false;
  }
  if (from == to) {
    return true;
  }
  auto received = checked_add(lookup(table, to), amount);
  if (!received) {
    return false;
  }
  table[from] = *remaining;
  table[to] = *received;
  return true;
}

bool asset_book::pull(const asset_id_t& asset,
                      const account_id_t& from,
                      const account_id_t& to,
                      const amount_t& amount) {
  if (is_zero(asset)) {
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  auto allowance_key = allowance_key_t{asset, from, to};
  auto left = checked_sub(lookup(allowances_, allowance_key), amount);
  if (!left) {
    spdlog::debug("Pull of {} {} by {} exceeds allowance", to_string(amount),
                  to_hex(asset), to_hex(to));
    return false;
  }
  if (!move_locked(holdings_, holding_key_t{asset, from},
                   holding_key_t{asset, to}, amount)) {
    return false;
  }
  allowances_[allowance_key] = *left;
  return true;
}

bool asset_book::authorize(const asset_id_t& asset,
                           const account_id_t& owner,
                           const account_id_t& spender,
                           const amount_t& amount) {
  if (is_zero(asset)) {
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  allowances_[allowance_key_t{asset, owner, spender}] = amount;
  return true;
}

bool asset_book::transfer(const asset_id_t& asset,
                          const account_id_t& from,
                          const account_id_t& to,
                          const amount_t& amount) {
  if (is_zero(asset)) {
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  return move_locked(holdings_, holding_key_t{asset, from},
                     holding_key_t{asset, to}, amount);
}

amount_t asset_book::balance_of(const asset_id_t& asset,
                                const account_id_t& holder) const {
  auto lock = std::scoped_lock{mutex_};
  return lookup(holdings_, holding_key_t{asset, holder});
}

bool asset_book::send_native(const account_id_t& from,
                             const account_id_t& to,
                             const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  return move_locked(native_, from, to, amount);
}

bool asset_book::mint(const asset_id_t& asset,
                      const account_id_t& holder,
                      const amount_t& amount) {
  if (is_zero(asset)) {
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  auto key = holding_key_t{asset, holder};
  auto minted = checked_add(lookup(holdings_, key), amount);
  if (!minted) {
    return false;
  }
  holdings_[key] = *minted;
  return true;
}

bool asset_book::mint_native(const account_id_t& holder,
                             const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto minted = checked_add(lookup(native_, holder), amount);
  if (!minted) {
    return false;
  }
  native_[holder] = *minted;
  return true;
}

amount_t asset_book::native_balance_of(const account_id_t& holder) const {
  auto lock = std::scoped_lock{mutex_};
  return lookup(native_, holder);
}

amount_t asset_book::allowance(const asset_id_t& asset,
                               const account_id_t& owner,
                               const account_id_t& spender) const {
  auto lock = std::scoped_lock{mutex_};
  return lookup(allowances_, allowance_key_t{asset, owner, spender});
}

}  // namespace custodian::simulation
