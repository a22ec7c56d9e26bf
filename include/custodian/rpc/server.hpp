#pragma once

#include <custodian/v1/custody.grpc.pb.h>
#include <custodian/common/clock.hpp>
#include <custodian/execution/engine.hpp>
#include <custodian/rpc/authenticator.hpp>
#include <custodian/schema/operation_result.hpp>
#include <custodian/simulation/asset_book.hpp>

namespace custodian::rpc {

inline constexpr std::string_view kAuthCodespace{"custodian.auth"};

/// Copy an engine result into its wire form.
void populate_operation_response(
    const custodian::schema::operation_result_t& source,
    custodian::v1::OperationResponse* destination);

/// Callback service exposing the custody engine.
///
/// Requests name their caller by public key and are stamped with the
/// listener's clock. Calls that move value or read the aggregate carry an
/// `Authorization`; one that fails verification gets the unauthorized code in
/// the `custodian.auth` codespace (Approve, which has no code fields, finishes
/// UNAUTHENTICATED). Malformed identifiers or amounts finish with
/// INVALID_ARGUMENT; ledger failures finish OK and carry the ledger error code
/// in the response.
/// The native deposit RPC plays the host: it moves the attached value into
/// custody before the engine runs.
struct listener final : public custodian::v1::Custody::CallbackService {
  listener(custodian::execution::engine& engine,
           authenticator& requests,
           custodian::simulation::asset_book& assets,
           custodian::common::clock_function_t clock);

  virtual grpc::ServerUnaryReactor* DepositNative(
      grpc::CallbackServerContext* context,
      const custodian::v1::DepositNativeRequest* request,
      custodian::v1::OperationResponse* response) override final;

  virtual grpc::ServerUnaryReactor* DepositAsset(
      grpc::CallbackServerContext* context,
      const custodian::v1::DepositAssetRequest* request,
      custodian::v1::OperationResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Withdraw(
      grpc::CallbackServerContext* context,
      const custodian::v1::WithdrawRequest* request,
      custodian::v1::OperationResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Balance(
      grpc::CallbackServerContext* context,
      const custodian::v1::BalanceRequest* request,
      custodian::v1::BalanceResponse* response) override final;

  /// Administrator-only; other callers get the unauthorized code.
  virtual grpc::ServerUnaryReactor* AggregateValue(
      grpc::CallbackServerContext* context,
      const custodian::v1::AggregateValueRequest* request,
      custodian::v1::AggregateValueResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const custodian::v1::InfoRequest* request,
      custodian::v1::InfoResponse* response) override final;

  /// Sandbox minting at the in-memory asset book. Unsigned; refuses the
  /// custody account.
  virtual grpc::ServerUnaryReactor* Faucet(
      grpc::CallbackServerContext* context,
      const custodian::v1::FaucetRequest* request,
      custodian::v1::FaucetResponse* response) override final;

  /// Sandbox allowance from `owner` to the custody account.
  virtual grpc::ServerUnaryReactor* Approve(
      grpc::CallbackServerContext* context,
      const custodian::v1::ApproveRequest* request,
      custodian::v1::ApproveResponse* response) override final;

  custodian::execution::engine& execution_engine_;
  authenticator& authenticator_;
  custodian::simulation::asset_book& asset_book_;
  custodian::common::clock_function_t clock_;
};

}  // namespace custodian::rpc
