#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <custodian/common/clock.hpp>
#include <custodian/config/options.hpp>
#include <custodian/crypto/verify.hpp>
#include <custodian/execution/engine.hpp>
#include <custodian/rpc/authenticator.hpp>
#include <custodian/rpc/server.hpp>
#include <custodian/simulation/asset_book.hpp>
#include <custodian/simulation/fixed_rate_exchange.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto parsed = custodian::config::parse_options(argc, argv);
  if (auto* error = std::get_if<custodian::config::options_error>(&parsed)) {
    std::cerr << "custodiand: " << error->reason << "\n\n"
              << custodian::config::make_options_description() << std::endl;
    return 1;
  }
  auto options = std::get<custodian::config::daemon_options>(parsed);
  if (options.show_help) {
    std::cout << custodian::config::make_options_description() << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(options.verbose ? spdlog::level::debug
                                    : spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "custodian", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  if (!custodian::crypto::available()) {
    spdlog::critical("OpenSSL does not provide ed25519; cannot authenticate");
    spdlog::shutdown();
    return 1;
  }

  const auto& ledger_config = options.ledger;
  auto asset_book = custodian::simulation::asset_book{};
  auto exchange = custodian::simulation::fixed_rate_exchange{
      ledger_config.exchange_adapter, ledger_config.settlement_asset,
      ledger_config.native_wrapper_asset, asset_book,
      custodian::common::system_clock_milliseconds};
  for (const auto& rate : options.exchange_rates) {
    exchange.set_rate(rate.asset, rate.numerator, rate.denominator);
    spdlog::info("Sandbox rate {} -> {}/{}", custodian::schema::to_hex(rate.asset),
                 custodian::schema::to_string(rate.numerator),
                 custodian::schema::to_string(rate.denominator));
  }
  if (options.exchange_reserve != 0 &&
      !asset_book.mint(ledger_config.settlement_asset, exchange.account(),
                       options.exchange_reserve)) {
    spdlog::error("Failed to mint the sandbox exchange reserve");
    return 1;
  }

  auto encoder = custodian::execution::engine::encoder_t{};
  auto storage =
      custodian::storage::make_storage<custodian::storage::rocksdb_storage_tag>(
          options.db_path);
  auto engine = custodian::execution::engine{encoder, storage, ledger_config,
                                             exchange, asset_book};

  spdlog::info("gRPC service listening on {}", options.grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto requests = custodian::rpc::authenticator{encoder, storage};
  auto grpc_listener = custodian::rpc::listener{
      engine, requests, asset_book,
      custodian::common::system_clock_milliseconds};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(options.grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", options.grpc_address);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
