#include <spdlog/spdlog.h>
#include <custodian/simulation/fixed_rate_exchange.hpp>

#include <stdexcept>
#include <utility>

using namespace custodian::schema;
using custodian::execution::conversion_request;

namespace custodian::simulation {

fixed_rate_exchange::fixed_rate_exchange(
    account_id_t account,
    asset_id_t settlement_asset,
    asset_id_t native_wrapper_asset,
    custodian::execution::asset_transfer_protocol& assets,
    custodian::common::clock_function_t clock)
    : account_{std::move(account)},
      settlement_asset_{std::move(settlement_asset)},
      native_wrapper_asset_{std::move(native_wrapper_asset)},
      assets_{assets},
      clock_{std::move(clock)} {}

bool fixed_rate_exchange::set_rate(const asset_id_t& asset,
                                   amount_t numerator,
                                   amount_t denominator) {
  if (is_zero(asset) || denominator == 0) {
    return false;
  }
  rates_[asset] = rate{.numerator = std::move(numerator),
                       .denominator = std::move(denominator)};
  return true;
}

std::optional<amount_t> fixed_rate_exchange::quote(
    const asset_id_t& asset,
    const amount_t& amount_in) const {
  auto it = rates_.find(asset);
  if (it == std::end(rates_)) {
    return std::nullopt;
  }
  try {
    auto product = static_cast<checked_amount_t>(amount_in) *
                   static_cast<checked_amount_t>(it->second.numerator);
    return static_cast<amount_t>(
        product / static_cast<checked_amount_t>(it->second.denominator));
  } catch (const std::overflow_error&) {
    return std::nullopt;
  }
}

std::optional<amount_t> fixed_rate_exchange::convert_exact_input(
    const conversion_request& request) {
  if (request.path.size() != 2 || request.path.back() != settlement_asset_) {
    spdlog::debug("Exchange rejected path of length {}", request.path.size());
    return std::nullopt;
  }
  auto native = request.native_value != 0;
  if (native && (request.path.front() != native_wrapper_asset_ ||
                 request.native_value != request.amount_in)) {
    spdlog::debug("Exchange rejected malformed native conversion");
    return std::nullopt;
  }
  if (clock_ && clock_() > request.deadline) {
    spdlog::debug("Exchange rejected expired request (deadline {})",
                  request.deadline);
    return std::nullopt;
  }

  auto amount_out = quote(request.path.front(), request.amount_in);
  if (!amount_out) {
    spdlog::debug("Exchange has no rate for {}", to_hex(request.path.front()));
    return std::nullopt;
  }
  if (*amount_out < request.min_amount_out) {
    spdlog::debug("Exchange output {} below minimum {}", to_string(*amount_out),
                  to_string(request.min_amount_out));
    return std::nullopt;
  }
  if (assets_.balance_of(settlement_asset_, account_) < *amount_out) {
    spdlog::warn("Exchange reserve cannot cover {}", to_string(*amount_out));
    return std::nullopt;
  }

  if (!take_input(request, native)) {
    return std::nullopt;
  }
  if (*amount_out != 0 && !assets_.transfer(settlement_asset_, account_,
                                            request.recipient, *amount_out)) {
    spdlog::error("Exchange payout of {} failed; returning input",
                  to_string(*amount_out));
    return_input(request, native);
    return std::nullopt;
  }
  return amount_out;
}

const account_id_t& fixed_rate_exchange::account() const {
  return account_;
}

bool fixed_rate_exchange::take_input(const conversion_request& request,
                                     bool native) {
  if (native) {
    return assets_.send_native(request.payer, account_, request.amount_in);
  }
  return assets_.pull(request.path.front(), request.payer, account_,
                      request.amount_in);
}

void fixed_rate_exchange::return_input(const conversion_request& request,
                                       bool native) {
  auto returned =
      native ? assets_.send_native(account_, request.payer, request.amount_in)
             : assets_.transfer(request.path.front(), account_, request.payer,
                                request.amount_in);
  if (!returned) {
    spdlog::error("Exchange failed to return input of {} to {}",
                  to_string(request.amount_in), to_hex(request.payer));
  }
}

}  // namespace custodian::simulation
