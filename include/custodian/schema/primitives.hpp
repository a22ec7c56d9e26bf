#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace custodian::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using asset_id_t = hash32_t;
// Callers are identified by their ed25519 public key.
using ed25519_signature_t = std::array<uint8_t, 64>;
using amount_t = boost::multiprecision::uint256_t;
// Same width as amount_t, but overflow and underflow raise instead of wrapping.
using checked_amount_t = boost::multiprecision::checked_uint256_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();
bool is_zero(const hash32_t& hash);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

/// Sum of two amounts, or std::nullopt when the result does not fit 256 bits.
std::optional<amount_t> checked_add(const amount_t& lhs, const amount_t& rhs);

/// Difference of two amounts, or std::nullopt when `rhs > lhs`.
std::optional<amount_t> checked_sub(const amount_t& lhs, const amount_t& rhs);

std::string to_string(const amount_t& amount);
std::optional<amount_t> try_make_amount(const std::string_view decimal);

}  // namespace custodian::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
