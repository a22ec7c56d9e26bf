#include <custodian/config/validation.hpp>

#include <string>
#include <utility>

using namespace custodian::schema;

namespace custodian::config {

namespace {

invalid_configuration_t invalid(std::string reason) {
  return invalid_configuration_t{.reason = std::move(reason)};
}

}  // namespace

std::optional<invalid_configuration_t> validate_configuration(
    const ledger_config_t& config) {
  if (config.version != 1) {
    return invalid("unsupported configuration version");
  }
  if (is_zero(config.custody_account)) {
    return invalid("custody account must be non-zero");
  }
  if (is_zero(config.administrator)) {
    return invalid("administrator must be non-zero");
  }
  if (is_zero(config.settlement_asset)) {
    return invalid("settlement asset must be non-zero");
  }
  if (is_zero(config.native_wrapper_asset)) {
    return invalid("native wrapper asset must be non-zero");
  }
  if (is_zero(config.exchange_adapter)) {
    return invalid("exchange adapter must be non-zero");
  }
  if (config.settlement_asset == config.native_wrapper_asset) {
    return invalid("settlement asset must differ from the native wrapper");
  }
  if (config.exchange_adapter == config.custody_account) {
    return invalid("exchange adapter must differ from the custody account");
  }
  if (config.capacity_limit == 0) {
    return invalid("capacity limit must be greater than zero");
  }
  if (config.withdrawal_ceiling == 0) {
    return invalid("withdrawal ceiling must be greater than zero");
  }
  if (config.conversion_deadline_window == 0) {
    return invalid("conversion deadline window must be greater than zero");
  }
  return std::nullopt;
}

}  // namespace custodian::config
