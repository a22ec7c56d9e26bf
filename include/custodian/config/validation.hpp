#pragma once

#include <custodian/schema/ledger_config.hpp>
#include <custodian/schema/ledger_error.hpp>
#include <optional>

namespace custodian::config {

/// Check the construction-time requirements of a ledger configuration.
///
/// Returns the first violated rule, or std::nullopt when the configuration
/// is usable.
std::optional<custodian::schema::invalid_configuration_t> validate_configuration(
    const custodian::schema::ledger_config_t& config);

}  // namespace custodian::config
