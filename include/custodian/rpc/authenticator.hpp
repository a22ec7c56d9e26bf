#pragma once

#include <custodian/schema/encoding/encoder.hpp>
#include <custodian/schema/encoding/scale/encoder.hpp>
#include <custodian/schema/primitives.hpp>
#include <custodian/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace custodian::rpc {

using encoder_t = custodian::schema::encoding::encoder<
    custodian::schema::encoding::scale_encoder_tag>;
using storage_t =
    custodian::storage::storage<custodian::storage::rocksdb_storage_tag>;

/// Bytes a caller signs for one request: SCALE encoding of the domain tag,
/// the method name, the caller, the nonce and the request fields in
/// declaration order, each exactly as sent on the wire.
custodian::schema::bytes_t make_signing_payload(
    encoder_t& encoder,
    std::string_view method,
    const custodian::schema::account_id_t& caller,
    uint64_t nonce,
    const std::vector<std::string>& fields);

/// Ed25519 request authentication with per-caller replay protection.
///
/// A request is accepted when its signature verifies under the caller's
/// public key and its nonce is strictly greater than the last nonce accepted
/// for that caller. Accepted nonces are persisted, so a replay is refused
/// across restarts as well.
class authenticator final {
 public:
  authenticator(encoder_t& encoder, storage_t& storage);

  bool authenticate(std::string_view method,
                    const custodian::schema::account_id_t& caller,
                    uint64_t nonce,
                    const std::string& signature,
                    const std::vector<std::string>& fields);

  std::optional<uint64_t> last_nonce(
      const custodian::schema::account_id_t& caller) const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
  mutable std::mutex mutex_;
};

}  // namespace custodian::rpc
