#pragma once

#include <custodian/schema/primitives.hpp>

namespace custodian::schema {

/// Host-supplied facts about one inbound call: who is calling, how much
/// native value was attached (already moved into custody by the host), and
/// the host's current time.
struct call_context final {
  account_id_t caller{};
  amount_t value{};
  timestamp_milliseconds_t timestamp{};
};

using call_context_t = call_context;

}  // namespace custodian::schema
