#include <gtest/gtest.h>
#include <custodian/crypto/verify.hpp>
#include <custodian/testing/signer.hpp>

#include <vector>

using custodian::schema::bytes_view_t;

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!custodian::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
  }
  auto key = custodian::testing::signer{};
  auto message = std::vector<uint8_t>{'c', 'u', 's', 't', 'o', 'd', 'y'};
  auto signature = key.sign(bytes_view_t{message.data(), message.size()});

  EXPECT_TRUE(custodian::crypto::verify_signature(
      bytes_view_t{message.data(), message.size()}, key.account(), signature));

  message[0] ^= 0x01;
  EXPECT_FALSE(custodian::crypto::verify_signature(
      bytes_view_t{message.data(), message.size()}, key.account(), signature));
}

TEST(crypto_verify, rejects_signature_from_another_key) {
  if (!custodian::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
  }
  auto alice = custodian::testing::signer{};
  auto mallory = custodian::testing::signer{};
  auto message = std::vector<uint8_t>{'a', 'd', 'm', 'i', 'n'};
  auto forged = mallory.sign(bytes_view_t{message.data(), message.size()});

  EXPECT_FALSE(custodian::crypto::verify_signature(
      bytes_view_t{message.data(), message.size()}, alice.account(), forged));
}

TEST(crypto_verify, rejects_all_zero_signature) {
  auto message = std::vector<uint8_t>{'x'};
  auto signature = custodian::schema::ed25519_signature_t{};
  auto not_a_key = custodian::schema::account_id_t{};
  not_a_key.fill(0xFF);
  EXPECT_FALSE(custodian::crypto::verify_signature(
      bytes_view_t{message.data(), message.size()}, not_a_key, signature));
}
