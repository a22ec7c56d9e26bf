#include <gtest/gtest.h>
#include <custodian/simulation/asset_book.hpp>
#include <custodian/simulation/fixed_rate_exchange.hpp>
#include <custodian/testing/ledger_fixture.hpp>

using namespace custodian::testing;
using namespace custodian::schema;
using custodian::execution::conversion_request;

namespace {

struct exchange_harness final {
  exchange_harness()
      : exchange{kExchange, kSettlement, kNativeWrapper, book,
                 [this] { return now; }} {
    exchange.set_rate(kToken, amount(3), amount(2));
    exchange.set_rate(kNativeWrapper, amount(2'000), amount(1));
    book.mint(kSettlement, kExchange, amount(10'000));
  }

  conversion_request token_request(const amount_t& amount_in) const {
    auto request = conversion_request{};
    request.amount_in = amount_in;
    request.path = {kToken, kSettlement};
    request.payer = kCustody;
    request.recipient = kCustody;
    request.deadline = now + 10;
    return request;
  }

  timestamp_milliseconds_t now{100};
  custodian::simulation::asset_book book;
  custodian::simulation::fixed_rate_exchange exchange;
};

}  // namespace

TEST(fixed_rate_exchange, quote_rounds_down) {
  auto harness = exchange_harness{};
  EXPECT_EQ(harness.exchange.quote(kToken, amount(3)), amount(4));
  EXPECT_FALSE(harness.exchange.quote(make_hash(0x77), amount(3)));
  EXPECT_FALSE(harness.exchange.set_rate(kToken, amount(1), amount(0)));
}

TEST(fixed_rate_exchange, token_conversion_moves_input_and_output) {
  auto harness = exchange_harness{};
  harness.book.mint(kToken, kCustody, amount(100));
  harness.book.authorize(kToken, kCustody, kExchange, amount(100));

  auto converted = harness.exchange.convert_exact_input(
      harness.token_request(amount(100)));
  ASSERT_TRUE(converted.has_value());
  EXPECT_EQ(*converted, amount(150));
  EXPECT_EQ(harness.book.balance_of(kSettlement, kCustody), amount(150));
  EXPECT_EQ(harness.book.balance_of(kToken, kExchange), amount(100));
  EXPECT_EQ(harness.book.balance_of(kSettlement, kExchange), amount(9'850));
}

TEST(fixed_rate_exchange, native_conversion_takes_native_value) {
  auto harness = exchange_harness{};
  harness.book.mint_native(kCustody, amount(2));
  auto request = conversion_request{};
  request.amount_in = amount(2);
  request.native_value = amount(2);
  request.path = {kNativeWrapper, kSettlement};
  request.payer = kCustody;
  request.recipient = kCustody;
  request.deadline = harness.now;

  auto converted = harness.exchange.convert_exact_input(request);
  ASSERT_TRUE(converted.has_value());
  EXPECT_EQ(*converted, amount(4'000));
  EXPECT_EQ(harness.book.native_balance_of(kCustody), amount(0));
  EXPECT_EQ(harness.book.native_balance_of(kExchange), amount(2));
}

TEST(fixed_rate_exchange, rejected_requests_move_nothing) {
  auto harness = exchange_harness{};
  harness.book.mint(kToken, kCustody, amount(100'000));
  harness.book.authorize(kToken, kCustody, kExchange, amount(100'000));

  auto below_minimum = harness.token_request(amount(10));
  below_minimum.min_amount_out = amount(16);
  EXPECT_FALSE(harness.exchange.convert_exact_input(below_minimum));

  auto expired = harness.token_request(amount(10));
  harness.now = expired.deadline + 1;
  EXPECT_FALSE(harness.exchange.convert_exact_input(expired));
  harness.now = 100;

  auto wrong_output = harness.token_request(amount(10));
  wrong_output.path = {kToken, kNativeWrapper};
  EXPECT_FALSE(harness.exchange.convert_exact_input(wrong_output));

  EXPECT_FALSE(
      harness.exchange.convert_exact_input(harness.token_request(amount(100'000))));

  EXPECT_EQ(harness.book.balance_of(kToken, kCustody), amount(100'000));
  EXPECT_EQ(harness.book.balance_of(kSettlement, kExchange), amount(10'000));
}

TEST(fixed_rate_exchange, missing_allowance_fails_before_payout) {
  auto harness = exchange_harness{};
  harness.book.mint(kToken, kCustody, amount(10));

  EXPECT_FALSE(
      harness.exchange.convert_exact_input(harness.token_request(amount(10))));
  EXPECT_EQ(harness.book.balance_of(kSettlement, kCustody), amount(0));
}
