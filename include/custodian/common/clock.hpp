#pragma once

#include <custodian/schema/primitives.hpp>
#include <chrono>
#include <functional>

namespace custodian::common {

/// Source of "now" in unix milliseconds; injected so tests control time.
using clock_function_t =
    std::function<custodian::schema::timestamp_milliseconds_t()>;

inline custodian::schema::timestamp_milliseconds_t system_clock_milliseconds() {
  return static_cast<custodian::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace custodian::common
