#pragma once

#include <custodian/schema/primitives.hpp>

namespace custodian::crypto {

/// True when the linked OpenSSL exposes ed25519.
bool available();

/// Verify an ed25519 `signature` over `message` by the account whose id is
/// the raw public key `signer`.
bool verify_signature(const custodian::schema::bytes_view_t& message,
                      const custodian::schema::account_id_t& signer,
                      const custodian::schema::ed25519_signature_t& signature);

}  // namespace custodian::crypto
