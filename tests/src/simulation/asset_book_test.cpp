#include <gtest/gtest.h>
#include <custodian/simulation/asset_book.hpp>
#include <custodian/testing/common.hpp>

#include <limits>

using custodian::testing::amount;
using custodian::testing::make_hash;
using namespace custodian::schema;

namespace {

const auto kAsset = make_hash(0x30);
const auto kOwner = make_hash(0xA0);
const auto kSpender = make_hash(0xB0);

}  // namespace

TEST(asset_book, mint_and_transfer_move_balances) {
  auto book = custodian::simulation::asset_book{};
  ASSERT_TRUE(book.mint(kAsset, kOwner, amount(100)));
  ASSERT_TRUE(book.transfer(kAsset, kOwner, kSpender, amount(40)));
  EXPECT_EQ(book.balance_of(kAsset, kOwner), amount(60));
  EXPECT_EQ(book.balance_of(kAsset, kSpender), amount(40));
}

TEST(asset_book, transfer_beyond_balance_changes_nothing) {
  auto book = custodian::simulation::asset_book{};
  ASSERT_TRUE(book.mint(kAsset, kOwner, amount(10)));
  EXPECT_FALSE(book.transfer(kAsset, kOwner, kSpender, amount(11)));
  EXPECT_EQ(book.balance_of(kAsset, kOwner), amount(10));
  EXPECT_EQ(book.balance_of(kAsset, kSpender), amount(0));
}

TEST(asset_book, pull_consumes_allowance) {
  auto book = custodian::simulation::asset_book{};
  ASSERT_TRUE(book.mint(kAsset, kOwner, amount(100)));
  ASSERT_TRUE(book.authorize(kAsset, kOwner, kSpender, amount(30)));

  EXPECT_TRUE(book.pull(kAsset, kOwner, kSpender, amount(20)));
  EXPECT_EQ(book.allowance(kAsset, kOwner, kSpender), amount(10));
  EXPECT_FALSE(book.pull(kAsset, kOwner, kSpender, amount(11)));
  EXPECT_EQ(book.balance_of(kAsset, kSpender), amount(20));
}

TEST(asset_book, pull_without_balance_keeps_allowance) {
  auto book = custodian::simulation::asset_book{};
  ASSERT_TRUE(book.authorize(kAsset, kOwner, kSpender, amount(30)));
  EXPECT_FALSE(book.pull(kAsset, kOwner, kSpender, amount(5)));
  EXPECT_EQ(book.allowance(kAsset, kOwner, kSpender), amount(30));
}

TEST(asset_book, authorize_sets_rather_than_adds) {
  auto book = custodian::simulation::asset_book{};
  ASSERT_TRUE(book.authorize(kAsset, kOwner, kSpender, amount(30)));
  ASSERT_TRUE(book.authorize(kAsset, kOwner, kSpender, amount(5)));
  EXPECT_EQ(book.allowance(kAsset, kOwner, kSpender), amount(5));
}

TEST(asset_book, zero_asset_is_refused) {
  auto book = custodian::simulation::asset_book{};
  EXPECT_FALSE(book.mint(make_zero_hash(), kOwner, amount(1)));
  EXPECT_FALSE(book.authorize(make_zero_hash(), kOwner, kSpender, amount(1)));
  EXPECT_FALSE(book.transfer(make_zero_hash(), kOwner, kSpender, amount(0)));
}

TEST(asset_book, native_sends_are_balance_checked) {
  auto book = custodian::simulation::asset_book{};
  ASSERT_TRUE(book.mint_native(kOwner, amount(5)));
  EXPECT_TRUE(book.send_native(kOwner, kSpender, amount(3)));
  EXPECT_FALSE(book.send_native(kOwner, kSpender, amount(3)));
  EXPECT_EQ(book.native_balance_of(kOwner), amount(2));
  EXPECT_EQ(book.native_balance_of(kSpender), amount(3));
}

TEST(asset_book, minting_past_256_bits_fails) {
  auto book = custodian::simulation::asset_book{};
  ASSERT_TRUE(book.mint(kAsset, kOwner, std::numeric_limits<amount_t>::max()));
  EXPECT_FALSE(book.mint(kAsset, kOwner, amount(1)));
  EXPECT_EQ(book.balance_of(kAsset, kOwner),
            std::numeric_limits<amount_t>::max());
}
