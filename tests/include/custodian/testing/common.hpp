#pragma once

#include <custodian/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace custodian::testing {

/// Distinct, recognizable 32-byte id: byte i is `seed + i`.
inline custodian::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = custodian::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline custodian::schema::amount_t amount(const uint64_t value) {
  return custodian::schema::amount_t{value};
}

// Clock ticks alone collide when two stores open within one tick.
inline std::string make_db_path(const std::string_view prefix) {
  static auto sequence = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::steady_clock::now().time_since_epoch().count();
  const auto name = std::string{prefix} + "_" +
                    std::to_string(static_cast<unsigned long long>(now)) +
                    "_" + std::to_string(sequence.fetch_add(1));
  return (std::filesystem::temp_directory_path() / name).string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Temporary database directory removed when the test scope ends.
class scoped_db_path final {
 public:
  explicit scoped_db_path(const std::string_view prefix)
      : path_{make_db_path(prefix)} {}
  ~scoped_db_path() { remove_path(path_); }

  scoped_db_path(const scoped_db_path&) = delete;
  scoped_db_path& operator=(const scoped_db_path&) = delete;

  const std::string& string() const { return path_; }

 private:
  std::string path_;
};

}  // namespace custodian::testing
