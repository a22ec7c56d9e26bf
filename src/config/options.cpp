#include <custodian/config/options.hpp>

#include <fstream>
#include <utility>

using namespace custodian::schema;

namespace custodian::config {

namespace {

std::optional<options_error> read_hash(
    const boost::program_options::variables_map& vm,
    const std::string& name,
    hash32_t& out) {
  if (!vm.contains(name)) {
    return options_error{.reason = "missing required option --" + name};
  }
  auto parsed = try_make_hash32(vm[name].as<std::string>());
  if (!parsed) {
    return options_error{.reason = "--" + name +
                                   " must be 32 bytes of hex (64 digits)"};
  }
  out = *parsed;
  return std::nullopt;
}

std::optional<options_error> read_amount(
    const boost::program_options::variables_map& vm,
    const std::string& name,
    amount_t& out) {
  if (!vm.contains(name)) {
    return options_error{.reason = "missing required option --" + name};
  }
  auto parsed = try_make_amount(vm[name].as<std::string>());
  if (!parsed) {
    return options_error{.reason = "--" + name +
                                   " must be an unsigned decimal integer"};
  }
  out = *parsed;
  return std::nullopt;
}

}  // namespace

boost::program_options::options_description make_options_description() {
  auto description = boost::program_options::options_description{"Custodian"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(),
      "INI file with any of the options below")(
      "verbose,v", "Enable debug logging")(
      "grpc-address,g",
      boost::program_options::value<std::string>()->default_value(
          "0.0.0.0:26660"),
      "IP:Port for the custody gRPC service")(
      "db-path,d",
      boost::program_options::value<std::string>()->default_value(
          "custodian-db"),
      "RocksDB directory")(
      "log-file",
      boost::program_options::value<std::string>()->default_value(
          "custodian.log"),
      "Log file written alongside the console")(
      "custody-account", boost::program_options::value<std::string>(),
      "Custody holder id (hex)")(
      "administrator", boost::program_options::value<std::string>(),
      "Account allowed to read the aggregate value (hex)")(
      "settlement-asset", boost::program_options::value<std::string>(),
      "Settlement currency asset id (hex)")(
      "native-wrapper-asset", boost::program_options::value<std::string>(),
      "Wrapped native asset id used as the first conversion hop (hex)")(
      "exchange-adapter", boost::program_options::value<std::string>(),
      "Exchange adapter account id (hex)")(
      "capacity-limit", boost::program_options::value<std::string>(),
      "Maximum aggregate custodied value (base units)")(
      "withdrawal-ceiling", boost::program_options::value<std::string>(),
      "Maximum amount per withdrawal call (base units)")(
      "deadline-window-ms",
      boost::program_options::value<uint64_t>()->default_value(300'000),
      "Milliseconds added to the call time to form the exchange deadline")(
      "failure-policy",
      boost::program_options::value<std::string>()->default_value("retain"),
      "Token deposit failure handling: retain or refund")(
      "rate",
      boost::program_options::value<std::vector<std::string>>()->composing(),
      "Sandbox exchange rate ASSET_HEX:NUM/DEN (repeatable)")(
      "exchange-reserve",
      boost::program_options::value<std::string>()->default_value("0"),
      "Settlement currency minted to the sandbox exchange at startup");
  return description;
}

std::optional<exchange_rate_option> try_parse_exchange_rate(
    std::string_view value) {
  auto colon = value.find(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  auto asset = try_make_hash32(value.substr(0, colon));
  if (!asset || is_zero(*asset)) {
    return std::nullopt;
  }

  auto ratio = value.substr(colon + 1);
  auto slash = ratio.find('/');
  auto numerator = try_make_amount(ratio.substr(0, slash));
  auto denominator = slash == std::string_view::npos
                         ? std::optional<amount_t>{amount_t{1}}
                         : try_make_amount(ratio.substr(slash + 1));
  if (!numerator || !denominator || *denominator == 0) {
    return std::nullopt;
  }
  return exchange_rate_option{
      .asset = *asset, .numerator = *numerator, .denominator = *denominator};
}

std::variant<daemon_options, options_error> parse_options(
    int argc,
    const char* const argv[]) {
  auto description = make_options_description();
  auto vm = boost::program_options::variables_map{};
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        return options_error{.reason = "cannot open config file " + path};
      }
      boost::program_options::store(
          boost::program_options::parse_config_file(file, description), vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    return options_error{.reason = e.what()};
  }

  auto options = daemon_options{};
  if (vm.contains("help")) {
    options.show_help = true;
    return options;
  }
  options.verbose = vm.contains("verbose");
  options.grpc_address = vm["grpc-address"].as<std::string>();
  options.db_path = vm["db-path"].as<std::string>();
  options.log_file = vm["log-file"].as<std::string>();

  auto& ledger = options.ledger;
  for (auto [name, field] :
       {std::pair{"custody-account", &ledger.custody_account},
        std::pair{"administrator", &ledger.administrator},
        std::pair{"settlement-asset", &ledger.settlement_asset},
        std::pair{"native-wrapper-asset", &ledger.native_wrapper_asset},
        std::pair{"exchange-adapter", &ledger.exchange_adapter}}) {
    if (auto error = read_hash(vm, name, *field)) {
      return *error;
    }
  }
  if (auto error = read_amount(vm, "capacity-limit", ledger.capacity_limit)) {
    return *error;
  }
  if (auto error =
          read_amount(vm, "withdrawal-ceiling", ledger.withdrawal_ceiling)) {
    return *error;
  }
  ledger.conversion_deadline_window = vm["deadline-window-ms"].as<uint64_t>();

  auto policy = try_parse_enum<conversion_failure_policy_t>(
      vm["failure-policy"].as<std::string>());
  if (!policy) {
    return options_error{.reason = "--failure-policy must be retain or refund"};
  }
  ledger.failure_policy = *policy;

  if (vm.contains("rate")) {
    for (const auto& value : vm["rate"].as<std::vector<std::string>>()) {
      auto rate = try_parse_exchange_rate(value);
      if (!rate) {
        return options_error{.reason = "invalid --rate value '" + value + "'"};
      }
      options.exchange_rates.push_back(*rate);
    }
  }
  if (auto error =
          read_amount(vm, "exchange-reserve", options.exchange_reserve)) {
    return *error;
  }
  return options;
}

}  // namespace custodian::config
