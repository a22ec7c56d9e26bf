#pragma once
#include <blake3.h>
#include <custodian/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace custodian::blake3 {

/// Incremental BLAKE3 hasher producing 32-byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const custodian::schema::bytes_view_t& bytes);
  hasher& update(const std::string_view& str);
  custodian::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

custodian::schema::hash32_t hash(const std::string_view& str);
custodian::schema::hash32_t hash(const custodian::schema::bytes_view_t& bytes);

}  // namespace custodian::blake3
