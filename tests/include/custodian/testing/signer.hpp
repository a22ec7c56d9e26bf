#pragma once

#include <custodian/rpc/authenticator.hpp>
#include <custodian/schema/primitives.hpp>
#include <openssl/evp.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace custodian::testing {

/// Fresh ed25519 key pair whose public key is the account id.
class signer final {
 public:
  signer() : key_{nullptr, EVP_PKEY_free} {
    auto* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    auto* raw = static_cast<EVP_PKEY*>(nullptr);
    auto generated = ctx != nullptr && EVP_PKEY_keygen_init(ctx) == 1 &&
                     EVP_PKEY_keygen(ctx, &raw) == 1;
    EVP_PKEY_CTX_free(ctx);
    if (!generated) {
      throw std::runtime_error{"ed25519 key generation failed"};
    }
    key_.reset(raw);
    auto size = account_.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), account_.data(), &size) != 1 ||
        size != account_.size()) {
      throw std::runtime_error{"ed25519 public key export failed"};
    }
  }

  const custodian::schema::account_id_t& account() const { return account_; }
  std::string hex() const { return custodian::schema::to_hex(account_); }

  custodian::schema::ed25519_signature_t sign(
      const custodian::schema::bytes_view_t& message) const {
    auto signature = custodian::schema::ed25519_signature_t{};
    auto size = signature.size();
    auto* ctx = EVP_MD_CTX_new();
    auto signed_ok =
        ctx != nullptr &&
        EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, key_.get()) == 1 &&
        EVP_DigestSign(ctx, signature.data(), &size, message.data(),
                       message.size()) == 1;
    EVP_MD_CTX_free(ctx);
    if (!signed_ok || size != signature.size()) {
      throw std::runtime_error{"ed25519 signing failed"};
    }
    return signature;
  }

  /// Signature over the request payload, as bytes for the wire.
  std::string sign_request(custodian::rpc::encoder_t& encoder,
                           std::string_view method,
                           uint64_t nonce,
                           const std::vector<std::string>& fields) const {
    auto payload = custodian::rpc::make_signing_payload(encoder, method,
                                                        account_, nonce, fields);
    auto signature =
        sign(custodian::schema::bytes_view_t{payload.data(), payload.size()});
    return std::string{reinterpret_cast<const char*>(signature.data()),
                       signature.size()};
  }

 private:
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
  custodian::schema::account_id_t account_{};
};

}  // namespace custodian::testing
