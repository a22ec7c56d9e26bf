#include <spdlog/spdlog.h>
#include <custodian/crypto/verify.hpp>
#include <custodian/rpc/authenticator.hpp>
#include <custodian/schema/key/ledger_keys.hpp>
#include <algorithm>

using namespace custodian::schema;

namespace {

inline constexpr auto kSigningDomain = std::string_view{"custodian.v1"};

}  // namespace

namespace custodian::rpc {

bytes_t make_signing_payload(encoder_t& encoder,
                             std::string_view method,
                             const account_id_t& caller,
                             uint64_t nonce,
                             const std::vector<std::string>& fields) {
  auto payload = encoder.encode(kSigningDomain);
  encoder.encode(method, payload);
  encoder.encode(caller, payload);
  encoder.encode(nonce, payload);
  encoder.encode(fields, payload);
  return payload;
}

authenticator::authenticator(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

bool authenticator::authenticate(std::string_view method,
                                 const account_id_t& caller,
                                 uint64_t nonce,
                                 const std::string& signature,
                                 const std::vector<std::string>& fields) {
  auto raw_signature = ed25519_signature_t{};
  if (signature.size() != raw_signature.size()) {
    spdlog::warn("Rejected {} by {}: signature is {} bytes", method,
                 to_hex(caller), signature.size());
    return false;
  }
  std::copy(std::begin(signature), std::end(signature),
            std::begin(raw_signature));

  auto payload = make_signing_payload(encoder_, method, caller, nonce, fields);
  if (!custodian::crypto::verify_signature(
          bytes_view_t{payload.data(), payload.size()}, caller,
          raw_signature)) {
    spdlog::warn("Rejected {} by {}: bad signature", method, to_hex(caller));
    return false;
  }

  auto lock = std::scoped_lock{mutex_};
  auto key = schema::key::make_nonce_key(encoder_, caller);
  auto last = storage_.get<uint64_t>(encoder_, key).value_or(0);
  if (nonce <= last) {
    spdlog::warn("Rejected {} by {}: nonce {} not above {}", method,
                 to_hex(caller), nonce, last);
    return false;
  }
  storage_.put(encoder_, key, nonce);
  return true;
}

std::optional<uint64_t> authenticator::last_nonce(
    const account_id_t& caller) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<uint64_t>(encoder_,
                                schema::key::make_nonce_key(encoder_, caller));
}

}  // namespace custodian::rpc
