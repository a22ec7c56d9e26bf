#include <spdlog/spdlog.h>
#include <custodian/execution/result.hpp>
#include <custodian/rpc/server.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace custodian::rpc;
using namespace custodian::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_invalid(grpc::CallbackServerContext* context,
                                         const std::string& message) {
  spdlog::debug("Rejecting request: {}", message);
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, message});
  return reactor;
}

grpc::ServerUnaryReactor* finish_unauthenticated(
    grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status{grpc::StatusCode::UNAUTHENTICATED,
                               "request signature or nonce rejected"});
  return reactor;
}

void populate_unauthorized(const account_id_t& caller,
                           custodian::v1::OperationResponse* response) {
  populate_operation_response(
      custodian::execution::make_error_result(unauthorized_t{.caller = caller},
                                              kAuthCodespace),
      response);
}

/// Empty strings read as zero when `allow_empty` is set.
std::optional<amount_t> read_amount(const std::string& value,
                                    const bool allow_empty = false) {
  if (value.empty() && allow_empty) {
    return amount_t{0};
  }
  return try_make_amount(value);
}

void populate_event(const ledger_event_t& source,
                    custodian::v1::Event* destination) {
  destination->set_type(std::string{enum_name(source.kind)});
  for (const auto& attribute : source.attributes) {
    auto* out = destination->add_attributes();
    out->set_key(attribute.key);
    out->set_value(attribute.value);
    out->set_index(attribute.indexed);
  }
}

}  // namespace

namespace custodian::rpc {

void populate_operation_response(const operation_result_t& source,
                                 custodian::v1::OperationResponse* destination) {
  destination->set_code(source.code);
  destination->set_codespace(source.codespace);
  destination->set_log(source.log);
  if (source.deposit) {
    auto* deposit = destination->mutable_deposit();
    deposit->set_deposit_id(source.deposit->deposit_id);
    deposit->set_depositor(to_hex(source.deposit->depositor));
    deposit->set_input_asset(to_hex(source.deposit->input_asset));
    deposit->set_input_amount(to_string(source.deposit->input_amount));
    deposit->set_proceeds(to_string(source.deposit->proceeds));
    deposit->set_recorded_at(source.deposit->recorded_at);
  }
  if (source.withdrawal) {
    auto* withdrawal = destination->mutable_withdrawal();
    withdrawal->set_withdrawal_id(source.withdrawal->withdrawal_id);
    withdrawal->set_recipient(to_hex(source.withdrawal->recipient));
    withdrawal->set_amount(to_string(source.withdrawal->amount));
    withdrawal->set_remaining_balance(
        to_string(source.withdrawal->remaining_balance));
    withdrawal->set_recorded_at(source.withdrawal->recorded_at);
  }
  for (const auto& event : source.events) {
    populate_event(event, destination->add_events());
  }
}

listener::listener(custodian::execution::engine& engine,
                   authenticator& requests,
                   custodian::simulation::asset_book& assets,
                   custodian::common::clock_function_t clock)
    : execution_engine_{engine},
      authenticator_{requests},
      asset_book_{assets},
      clock_{std::move(clock)} {}

grpc::ServerUnaryReactor* listener::DepositNative(
    grpc::CallbackServerContext* context,
    const custodian::v1::DepositNativeRequest* request,
    custodian::v1::OperationResponse* response) {
  auto caller = try_make_hash32(request->caller());
  auto value = read_amount(request->value(), true);
  auto min_proceeds = read_amount(request->min_proceeds(), true);
  if (!caller || !value || !min_proceeds) {
    return finish_invalid(context, "malformed native deposit request");
  }
  if (!authenticator_.authenticate(
          "DepositNative", *caller, request->authorization().nonce(),
          request->authorization().signature(),
          {request->value(), request->min_proceeds()})) {
    populate_unauthorized(*caller, response);
    return finish_ok(context);
  }

  const auto& custody = execution_engine_.config().custody_account;
  if (*value != 0 && !asset_book_.send_native(*caller, custody, *value)) {
    populate_operation_response(
        custodian::execution::make_error_result(
            transfer_failed_t{.asset = make_zero_hash()},
            custodian::execution::kDepositCodespace),
        response);
    return finish_ok(context);
  }

  auto call = call_context_t{
      .caller = *caller, .value = *value, .timestamp = clock_()};
  auto result = execution_engine_.deposit_native(call, *min_proceeds);
  if (result.error && std::holds_alternative<reentrant_call_t>(*result.error)) {
    // The engine never saw the value; hand it back as a reverted call would.
    if (!asset_book_.send_native(custody, *caller, *value)) {
      spdlog::error("Failed returning native value {} to {}",
                    to_string(*value), to_hex(*caller));
    }
  }
  populate_operation_response(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::DepositAsset(
    grpc::CallbackServerContext* context,
    const custodian::v1::DepositAssetRequest* request,
    custodian::v1::OperationResponse* response) {
  auto caller = try_make_hash32(request->caller());
  auto asset = try_make_hash32(request->asset());
  auto amount = read_amount(request->amount());
  auto min_proceeds = read_amount(request->min_proceeds(), true);
  if (!caller || !asset || !amount || !min_proceeds) {
    return finish_invalid(context, "malformed asset deposit request");
  }
  if (!authenticator_.authenticate(
          "DepositAsset", *caller, request->authorization().nonce(),
          request->authorization().signature(),
          {request->asset(), request->amount(), request->min_proceeds()})) {
    populate_unauthorized(*caller, response);
    return finish_ok(context);
  }

  auto call = call_context_t{.caller = *caller, .value = 0, .timestamp = clock_()};
  populate_operation_response(
      execution_engine_.deposit_asset(call, *asset, *amount, *min_proceeds),
      response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Withdraw(
    grpc::CallbackServerContext* context,
    const custodian::v1::WithdrawRequest* request,
    custodian::v1::OperationResponse* response) {
  auto caller = try_make_hash32(request->caller());
  auto amount = read_amount(request->amount());
  if (!caller || !amount) {
    return finish_invalid(context, "malformed withdraw request");
  }
  if (!authenticator_.authenticate("Withdraw", *caller,
                                   request->authorization().nonce(),
                                   request->authorization().signature(),
                                   {request->amount()})) {
    populate_unauthorized(*caller, response);
    return finish_ok(context);
  }

  auto call = call_context_t{.caller = *caller, .value = 0, .timestamp = clock_()};
  populate_operation_response(execution_engine_.withdraw(call, *amount),
                              response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Balance(
    grpc::CallbackServerContext* context,
    const custodian::v1::BalanceRequest* request,
    custodian::v1::BalanceResponse* response) {
  auto account = try_make_hash32(request->account());
  if (!account) {
    return finish_invalid(context, "malformed account id");
  }
  response->set_balance(to_string(execution_engine_.balance_of(*account)));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::AggregateValue(
    grpc::CallbackServerContext* context,
    const custodian::v1::AggregateValueRequest* request,
    custodian::v1::AggregateValueResponse* response) {
  auto caller = try_make_hash32(request->caller());
  if (!caller) {
    return finish_invalid(context, "malformed caller id");
  }
  if (!authenticator_.authenticate("AggregateValue", *caller,
                                   request->authorization().nonce(),
                                   request->authorization().signature(), {})) {
    auto error = ledger_error_t{unauthorized_t{.caller = *caller}};
    response->set_code(static_cast<uint32_t>(error_code(error)));
    response->set_codespace(std::string{kAuthCodespace});
    response->set_log(describe(error));
    return finish_ok(context);
  }
  auto aggregate = execution_engine_.aggregate_value(*caller);
  if (!aggregate) {
    auto error = ledger_error_t{unauthorized_t{.caller = *caller}};
    response->set_code(static_cast<uint32_t>(error_code(error)));
    response->set_codespace(std::string{custodian::execution::kEngineCodespace});
    response->set_log(describe(error));
    return finish_ok(context);
  }
  response->set_aggregate_value(to_string(*aggregate));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const custodian::v1::InfoRequest* /*request*/,
    custodian::v1::InfoResponse* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_deposit_count(info.deposit_count);
  response->set_withdrawal_count(info.withdrawal_count);
  response->set_capacity_limit(to_string(info.capacity_limit));
  response->set_withdrawal_ceiling(to_string(info.withdrawal_ceiling));
  response->set_state_root(
      std::string{reinterpret_cast<const char*>(info.state_root.data()),
                  info.state_root.size()});
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Faucet(
    grpc::CallbackServerContext* context,
    const custodian::v1::FaucetRequest* request,
    custodian::v1::FaucetResponse* response) {
  auto account = try_make_hash32(request->account());
  auto amount = read_amount(request->amount());
  if (!account || !amount) {
    return finish_invalid(context, "malformed faucet request");
  }
  // Minting into custody would show up as deposit proceeds.
  if (*account == execution_engine_.config().custody_account) {
    return finish_invalid(context, "faucet cannot credit the custody account");
  }

  if (request->asset().empty()) {
    if (!asset_book_.mint_native(*account, *amount)) {
      return finish_invalid(context, "native mint overflows");
    }
    response->set_balance(to_string(asset_book_.native_balance_of(*account)));
    return finish_ok(context);
  }

  auto asset = try_make_hash32(request->asset());
  if (!asset || !asset_book_.mint(*asset, *account, *amount)) {
    return finish_invalid(context, "invalid asset or mint overflows");
  }
  response->set_balance(to_string(asset_book_.balance_of(*asset, *account)));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Approve(
    grpc::CallbackServerContext* context,
    const custodian::v1::ApproveRequest* request,
    custodian::v1::ApproveResponse* response) {
  auto owner = try_make_hash32(request->owner());
  auto asset = try_make_hash32(request->asset());
  auto amount = read_amount(request->amount(), true);
  if (!owner || !asset || !amount) {
    return finish_invalid(context, "malformed approve request");
  }
  if (!authenticator_.authenticate(
          "Approve", *owner, request->authorization().nonce(),
          request->authorization().signature(),
          {request->asset(), request->amount()})) {
    return finish_unauthenticated(context);
  }

  const auto& custody = execution_engine_.config().custody_account;
  if (!asset_book_.authorize(*asset, *owner, custody, *amount)) {
    return finish_invalid(context, "asset id must be non-zero");
  }
  response->set_allowance(
      to_string(asset_book_.allowance(*asset, *owner, custody)));
  return finish_ok(context);
}

}  // namespace custodian::rpc
