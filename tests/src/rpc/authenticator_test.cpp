#include <gtest/gtest.h>
#include <custodian/rpc/authenticator.hpp>
#include <custodian/testing/common.hpp>
#include <custodian/testing/signer.hpp>

#include <optional>
#include <string>

using namespace custodian::testing;

namespace {

struct authenticator_harness final {
  explicit authenticator_harness(const std::string_view prefix)
      : path{prefix},
        storage{custodian::storage::make_storage<
            custodian::storage::rocksdb_storage_tag>(path.string())},
        requests{encoder, storage} {}

  scoped_db_path path;
  custodian::rpc::encoder_t encoder;
  custodian::rpc::storage_t storage;
  custodian::rpc::authenticator requests;
};

}  // namespace

TEST(rpc_authenticator, accepts_signed_request_and_records_nonce) {
  auto harness = authenticator_harness{"custodian_auth_accept"};
  auto alice = signer{};
  auto signature =
      alice.sign_request(harness.encoder, "Withdraw", 1, {"250"});

  EXPECT_TRUE(harness.requests.authenticate("Withdraw", alice.account(), 1,
                                            signature, {"250"}));
  EXPECT_EQ(harness.requests.last_nonce(alice.account()), 1u);
}

TEST(rpc_authenticator, replayed_nonce_is_refused) {
  auto harness = authenticator_harness{"custodian_auth_replay"};
  auto alice = signer{};
  auto signature = alice.sign_request(harness.encoder, "Withdraw", 7, {"1"});

  ASSERT_TRUE(harness.requests.authenticate("Withdraw", alice.account(), 7,
                                            signature, {"1"}));
  EXPECT_FALSE(harness.requests.authenticate("Withdraw", alice.account(), 7,
                                             signature, {"1"}));

  auto older = alice.sign_request(harness.encoder, "Withdraw", 3, {"1"});
  EXPECT_FALSE(harness.requests.authenticate("Withdraw", alice.account(), 3,
                                             older, {"1"}));
  EXPECT_EQ(harness.requests.last_nonce(alice.account()), 7u);
}

TEST(rpc_authenticator, signature_binds_method_fields_and_caller) {
  auto harness = authenticator_harness{"custodian_auth_binding"};
  auto alice = signer{};
  auto bob = signer{};
  auto signature = alice.sign_request(harness.encoder, "Withdraw", 1, {"10"});

  EXPECT_FALSE(harness.requests.authenticate("Withdraw", alice.account(), 1,
                                             signature, {"1000"}));
  EXPECT_FALSE(harness.requests.authenticate("DepositAsset", alice.account(), 1,
                                             signature, {"10"}));
  EXPECT_FALSE(harness.requests.authenticate("Withdraw", bob.account(), 1,
                                             signature, {"10"}));
  EXPECT_FALSE(harness.requests.last_nonce(alice.account()).has_value());
  EXPECT_FALSE(harness.requests.last_nonce(bob.account()).has_value());
}

TEST(rpc_authenticator, malformed_signature_is_refused) {
  auto harness = authenticator_harness{"custodian_auth_malformed"};
  auto alice = signer{};
  EXPECT_FALSE(harness.requests.authenticate("Withdraw", alice.account(), 1,
                                             std::string(63, '\0'), {"1"}));
  EXPECT_FALSE(harness.requests.authenticate("Withdraw", alice.account(), 1,
                                             std::string{}, {"1"}));
}

TEST(rpc_authenticator, nonces_survive_reopening_storage) {
  auto path = scoped_db_path{"custodian_auth_reopen"};
  auto encoder = custodian::rpc::encoder_t{};
  auto alice = signer{};
  auto signature = alice.sign_request(encoder, "AggregateValue", 4, {});
  {
    auto storage = custodian::storage::make_storage<
        custodian::storage::rocksdb_storage_tag>(path.string());
    auto requests = custodian::rpc::authenticator{encoder, storage};
    ASSERT_TRUE(requests.authenticate("AggregateValue", alice.account(), 4,
                                      signature, {}));
  }

  auto storage = custodian::storage::make_storage<
      custodian::storage::rocksdb_storage_tag>(path.string());
  auto requests = custodian::rpc::authenticator{encoder, storage};
  EXPECT_FALSE(requests.authenticate("AggregateValue", alice.account(), 4,
                                     signature, {}));
  EXPECT_EQ(requests.last_nonce(alice.account()), 4u);
}
