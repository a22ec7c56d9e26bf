#include <spdlog/spdlog.h>
#include <custodian/blake3/hash.hpp>
#include <custodian/common/critical.hpp>
#include <custodian/config/validation.hpp>
#include <custodian/execution/engine.hpp>
#include <custodian/execution/result.hpp>
#include <custodian/schema/key/ledger_keys.hpp>
#include <iterator>
#include <utility>
#include <vector>

using namespace custodian::schema;

namespace {

inline constexpr auto kStateRootDomain =
    std::string_view{"custodian-ledger-state-v2"};
inline constexpr auto kAccountLeafDomain =
    std::string_view{"custodian-ledger-account-v1"};

void fold_leaf(hash32_t& digest, const hash32_t& leaf) {
  for (auto i = std::size_t{0}; i < digest.size(); ++i) {
    digest[i] ^= leaf[i];
  }
}

ledger_config_t validated(ledger_config_t config) {
  if (auto error = custodian::config::validate_configuration(config)) {
    custodian::common::critical("invalid ledger configuration: {}",
                                error->reason);
  }
  return config;
}

}  // namespace

namespace custodian::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               ledger_config_t config,
               exchange_adapter& exchange,
               asset_transfer_protocol& assets)
    : encoder_{encoder},
      storage_{storage},
      config_{validated(std::move(config))},
      ledger_{config_.capacity_limit, config_.withdrawal_ceiling},
      deposit_pipeline_{config_, ledger_, exchange, assets},
      withdrawal_gate_{config_, ledger_, assets} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing custody engine (capacity {}, ceiling {}, policy {})",
               to_string(config_.capacity_limit),
               to_string(config_.withdrawal_ceiling),
               to_string(config_.failure_policy));
  load_persisted_state();
  spdlog::info("Custody engine ready: {} account(s), aggregate {}, root {}",
               state_.balances.size(), to_string(state_.totals.aggregate_value),
               to_hex(state_root_));
}

template <typename Body>
operation_result_t engine::mutate(std::string_view operation,
                                  const account_id_t& account,
                                  Body&& body) {
  auto guard = reentrancy_lock_.try_acquire();
  if (!guard) {
    spdlog::warn("Rejected reentrant {} by {}", operation, to_hex(account));
    return make_error_result(reentrant_call_t{}, kEngineCodespace);
  }

  // The body only ever touches the caller's entry and the totals.
  auto working = ledger_state_t{};
  auto before = std::optional<amount_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    working.totals = state_.totals;
    if (auto it = state_.balances.find(account); it != state_.balances.end()) {
      before = it->second;
      working.balances.emplace(account, it->second);
    }
  }

  auto result = std::forward<Body>(body)(working);
  if (!succeeded(result)) {
    return result;
  }

  auto after = ledger_.balance_of(working, account);
  auto digest = balances_digest_;
  if (before) {
    fold_leaf(digest, account_leaf(account, *before));
  }
  fold_leaf(digest, account_leaf(account, after));
  auto root = state_root(working.totals, digest);
  persist(working.totals, account, after, root);

  auto lock = std::scoped_lock{mutex_};
  state_.balances.insert_or_assign(account, after);
  state_.totals = working.totals;
  balances_digest_ = digest;
  state_root_ = root;
  spdlog::debug("Committed {} for {}; state root {}", operation,
                to_hex(account), to_hex(state_root_));
  return result;
}

operation_result_t engine::deposit_native(const call_context_t& context,
                                          const amount_t& min_proceeds) {
  return mutate("deposit_native", context.caller,
                [&](ledger_state_t& working) {
                  return deposit_pipeline_.deposit_native(working, context,
                                                          min_proceeds);
                });
}

operation_result_t engine::deposit_asset(const call_context_t& context,
                                         const asset_id_t& asset,
                                         const amount_t& amount,
                                         const amount_t& min_proceeds) {
  return mutate("deposit_asset", context.caller, [&](ledger_state_t& working) {
    return deposit_pipeline_.deposit_asset(working, context, asset, amount,
                                           min_proceeds);
  });
}

operation_result_t engine::withdraw(const call_context_t& context,
                                    const amount_t& amount) {
  return mutate("withdraw", context.caller, [&](ledger_state_t& working) {
    return withdrawal_gate_.withdraw(working, context, amount);
  });
}

amount_t engine::balance_of(const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.balance_of(state_, account);
}

std::optional<amount_t> engine::aggregate_value(
    const account_id_t& caller) const {
  if (caller != config_.administrator) {
    spdlog::warn("Aggregate value requested by non-administrator {}",
                 to_hex(caller));
    return std::nullopt;
  }
  auto lock = std::scoped_lock{mutex_};
  return state_.totals.aggregate_value;
}

uint64_t engine::deposit_count() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.totals.deposit_count;
}

uint64_t engine::withdrawal_count() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.totals.withdrawal_count;
}

const amount_t& engine::capacity() const {
  return ledger_.capacity_limit();
}

const amount_t& engine::withdrawal_ceiling() const {
  return ledger_.withdrawal_ceiling();
}

const ledger_config_t& engine::config() const {
  return config_;
}

ledger_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = ledger_info_t{};
  result.deposit_count = state_.totals.deposit_count;
  result.withdrawal_count = state_.totals.withdrawal_count;
  result.capacity_limit = ledger_.capacity_limit();
  result.withdrawal_ceiling = ledger_.withdrawal_ceiling();
  result.state_root = state_root_;
  return result;
}

void engine::persist(const ledger_totals_t& totals,
                     const account_id_t& account,
                     const amount_t& balance,
                     const hash32_t& root) {
  auto entries = std::vector<custodian::storage::key_value_entry_t>{};
  entries.emplace_back(schema::key::make_balance_key(encoder_, account),
                       encoder_.encode(balance));
  entries.emplace_back(
      schema::key::make_prefix_key(encoder_, schema::key::kLedgerTotalsKey),
      encoder_.encode(totals));
  entries.emplace_back(
      schema::key::make_prefix_key(encoder_, schema::key::kStateRootKey),
      encoder_.encode(root));
  storage_.write_batch(entries);
}

hash32_t engine::account_leaf(const account_id_t& account,
                              const amount_t& balance) const {
  auto encoded = encoder_.encode(balance);
  return custodian::blake3::hasher{}
      .update(kAccountLeafDomain)
      .update(bytes_view_t{account.data(), account.size()})
      .update(bytes_view_t{encoded.data(), encoded.size()})
      .finalize();
}

hash32_t engine::state_root(const ledger_totals_t& totals,
                            const hash32_t& balances_digest) const {
  auto encoded = encoder_.encode(totals);
  return custodian::blake3::hasher{}
      .update(kStateRootDomain)
      .update(bytes_view_t{encoded.data(), encoded.size()})
      .update(bytes_view_t{balances_digest.data(), balances_digest.size()})
      .finalize();
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted ledger state");
  auto config_key =
      schema::key::make_prefix_key(encoder_, schema::key::kLedgerConfigKey);
  if (auto stored = storage_.get<ledger_config_t>(encoder_, config_key)) {
    if (encoder_.encode(*stored) != encoder_.encode(config_)) {
      custodian::common::critical(
          "configured ledger differs from the persisted configuration");
    }
  } else {
    storage_.put(encoder_, config_key, config_);
  }

  auto totals_key =
      schema::key::make_prefix_key(encoder_, schema::key::kLedgerTotalsKey);
  auto root_key =
      schema::key::make_prefix_key(encoder_, schema::key::kStateRootKey);
  auto totals = storage_.get<ledger_totals_t>(encoder_, totals_key);

  auto balance_prefix =
      schema::key::make_prefix_key(encoder_, schema::key::kBalanceKeyPrefix);
  auto sum = amount_t{0};
  for (const auto& [key, value] : storage_.list_by_prefix(balance_prefix)) {
    auto account = schema::key::parse_balance_key(
        encoder_, bytes_view_t{key.data(), key.size()});
    if (!account) {
      custodian::common::critical("malformed balance key in storage");
    }
    auto balance =
        encoder_.decode<amount_t>(bytes_view_t{value.data(), value.size()});
    auto next = checked_add(sum, balance);
    if (!next) {
      custodian::common::critical("persisted balances overflow");
    }
    sum = *next;
    fold_leaf(balances_digest_, account_leaf(*account, balance));
    state_.balances.emplace(*account, balance);
  }

  if (!totals) {
    if (!state_.balances.empty()) {
      custodian::common::critical("persisted balances without ledger totals");
    }
    state_root_ = state_root(state_.totals, balances_digest_);
    storage_.write_batch({{totals_key, encoder_.encode(state_.totals)},
                          {root_key, encoder_.encode(state_root_)}});
    spdlog::info("Initialized empty ledger");
    return;
  }

  state_.totals = *totals;
  if (sum != state_.totals.aggregate_value) {
    custodian::common::critical(
        "persisted balances sum to {} but the aggregate is {}", to_string(sum),
        to_string(state_.totals.aggregate_value));
  }

  state_root_ = state_root(state_.totals, balances_digest_);
  auto stored_root = storage_.get<hash32_t>(encoder_, root_key);
  if (!stored_root || *stored_root != state_root_) {
    custodian::common::critical(
        "persisted state root does not match ledger contents");
  }
  spdlog::info("Loaded ledger: {} deposit(s), {} withdrawal(s)",
               state_.totals.deposit_count, state_.totals.withdrawal_count);
}

}  // namespace custodian::execution
