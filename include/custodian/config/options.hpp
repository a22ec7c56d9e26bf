#pragma once

#include <boost/program_options.hpp>
#include <custodian/schema/ledger_config.hpp>
#include <custodian/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace custodian::config {

/// Settlement currency paid per unit of `asset` by the sandbox exchange,
/// written `ASSET_HEX:NUMERATOR/DENOMINATOR` on the command line.
struct exchange_rate_option final {
  custodian::schema::asset_id_t asset{};
  custodian::schema::amount_t numerator{};
  custodian::schema::amount_t denominator{1};
};

/// Everything `custodiand` needs to start.
struct daemon_options final {
  bool show_help{false};
  bool verbose{false};
  std::string grpc_address{"0.0.0.0:26660"};
  std::string db_path{"custodian-db"};
  std::string log_file{"custodian.log"};
  custodian::schema::ledger_config_t ledger;
  std::vector<exchange_rate_option> exchange_rates;
  custodian::schema::amount_t exchange_reserve{};
};

struct options_error final {
  std::string reason;
};

/// Option table shared by the command line and the `--config` INI file.
boost::program_options::options_description make_options_description();

/// Parse the command line, then the INI file named by `--config` if any.
/// Command line values take precedence over file values.
std::variant<daemon_options, options_error> parse_options(
    int argc,
    const char* const argv[]);

std::optional<exchange_rate_option> try_parse_exchange_rate(
    std::string_view value);

}  // namespace custodian::config
