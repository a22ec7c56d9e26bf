#include <custodian/schema/encoding/scale/encoder.hpp>
#include <custodian/schema/key/ledger_keys.hpp>
#include <custodian/storage/rocksdb/storage.hpp>
#include <custodian/storage/storage.hpp>
#include <custodian/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using namespace custodian::schema;
using custodian::testing::amount;
using custodian::testing::make_hash;
using custodian::testing::scoped_db_path;

namespace {

using storage_t =
    custodian::storage::storage<custodian::storage::rocksdb_storage_tag>;
using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

storage_t open(const std::string& path) {
  return custodian::storage::make_storage<
      custodian::storage::rocksdb_storage_tag>(path);
}

}  // namespace

TEST(storage_types, missing_key_is_nullopt) {
  auto db = scoped_db_path{"custodian_storage_missing"};
  {
    auto encoder = encoder_t{};
    auto storage = open(db.string());
    auto key = key::make_prefix_key(encoder, key::kLedgerTotalsKey);
    EXPECT_FALSE(storage.get<ledger_totals_t>(encoder, make_bytes_view(key)));
  }
}

TEST(storage_types, values_survive_reopen) {
  auto db = scoped_db_path{"custodian_storage_reopen"};
  auto encoder = encoder_t{};
  auto key = key::make_prefix_key(encoder, key::kLedgerTotalsKey);
  {
    auto storage = open(db.string());
    auto totals = ledger_totals_t{};
    totals.aggregate_value = amount(77);
    totals.deposit_count = 2;
    storage.put(encoder, make_bytes_view(key), totals);
  }
  {
    auto storage = open(db.string());
    auto loaded = storage.get<ledger_totals_t>(encoder, make_bytes_view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->aggregate_value, amount(77));
    EXPECT_EQ(loaded->deposit_count, 2u);
    EXPECT_EQ(loaded->withdrawal_count, 0u);
  }
}

TEST(storage_types, list_by_prefix_returns_only_balances) {
  auto db = scoped_db_path{"custodian_storage_prefix"};
  {
    auto encoder = encoder_t{};
    auto storage = open(db.string());
    const auto accounts = std::vector{make_hash(1), make_hash(2), make_hash(3)};
    for (std::size_t i = 0; i < accounts.size(); ++i) {
      auto key = key::make_balance_key(encoder, accounts[i]);
      storage.put(encoder, make_bytes_view(key), amount(100 * (i + 1)));
    }
    storage.put(encoder,
                make_bytes_view(
                    key::make_prefix_key(encoder, key::kLedgerTotalsKey)),
                ledger_totals_t{});

    auto entries = storage.list_by_prefix(make_bytes_view(
        key::make_prefix_key(encoder, key::kBalanceKeyPrefix)));
    ASSERT_EQ(entries.size(), accounts.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
      auto account =
          key::parse_balance_key(encoder, make_bytes_view(entries[i].first));
      ASSERT_TRUE(account.has_value());
      EXPECT_EQ(*account, accounts[i]);
      EXPECT_EQ(encoder.decode<amount_t>(make_bytes_view(entries[i].second)),
                amount(100 * (i + 1)));
    }
  }
}

TEST(storage_types, write_batch_applies_every_entry) {
  auto db = scoped_db_path{"custodian_storage_batch"};
  {
    auto encoder = encoder_t{};
    auto storage = open(db.string());
    auto balance_key = key::make_balance_key(encoder, make_hash(9));
    auto root_key = key::make_prefix_key(encoder, key::kStateRootKey);
    const auto root = make_hash(0x42);

    storage.write_batch({
        {balance_key, encoder.encode(amount(5))},
        {root_key, encoder.encode(root)},
    });

    EXPECT_EQ(storage.get<amount_t>(encoder, make_bytes_view(balance_key)),
              amount(5));
    EXPECT_EQ(storage.get<hash32_t>(encoder, make_bytes_view(root_key)), root);
  }
}
