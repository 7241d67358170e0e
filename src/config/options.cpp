#include <covenant/config/options.hpp>
#include <covenant/schema/primitives.hpp>
#include <fstream>

namespace po = boost::program_options;

namespace covenant::config {

po::options_description make_options_description() {
  auto description = po::options_description{"covenantd"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI configuration file")(
      "db-path,d", po::value<std::string>()->default_value("covenant-data"),
      "RocksDB directory")("platform-account,p", po::value<std::string>(),
                           "platform account id (32-byte hex)")(
      "escrow-fee-bps", po::value<uint32_t>()->default_value(100),
      "escrow platform fee in basis points")(
      "marketplace-fee-bps", po::value<uint32_t>()->default_value(250),
      "initial marketplace platform fee in basis points")(
      "max-delegation-hops", po::value<uint32_t>()->default_value(50),
      "delegation chain hop limit")(
      "min-escrow-duration", po::value<uint64_t>()->default_value(86400),
      "minimum escrow duration in seconds")(
      "blocks,b", po::value<std::string>(),
      "block input file, one 'height time base64-tx' line per transaction")(
      "log-file", po::value<std::string>()->default_value("covenant.log"),
      "log file path")("verbose,v", "Enable verbose output");
  return description;
}

std::optional<daemon_options> parse_daemon_options(int argc,
                                                   const char* const argv[],
                                                   std::string& error) {
  auto description = make_options_description();
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        error = "cannot open config file " + path;
        return std::nullopt;
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    error = ex.what();
    return std::nullopt;
  }

  auto options = daemon_options{};
  options.help = vm.contains("help");
  if (options.help) {
    return options;
  }
  options.verbose = vm.contains("verbose");
  options.db_path = vm["db-path"].as<std::string>();
  options.log_file = vm["log-file"].as<std::string>();
  if (vm.contains("blocks")) {
    options.blocks_file = vm["blocks"].as<std::string>();
  }

  if (!vm.contains("platform-account")) {
    error = "--platform-account is required";
    return std::nullopt;
  }
  auto platform = covenant::schema::try_make_hash32(
      vm["platform-account"].as<std::string>());
  if (!platform || covenant::schema::is_null(*platform)) {
    error = "--platform-account must be a non-zero 32-byte hex id";
    return std::nullopt;
  }
  options.engine.platform_account = *platform;

  auto bps = [&](const char* name) -> std::optional<uint16_t> {
    auto value = vm[name].as<uint32_t>();
    if (value > covenant::schema::kBasisPointsDenominator) {
      error = std::string{"--"} + name + " exceeds 10000 bps";
      return std::nullopt;
    }
    return static_cast<uint16_t>(value);
  };
  auto escrow_fee = bps("escrow-fee-bps");
  if (!escrow_fee) {
    return std::nullopt;
  }
  auto marketplace_fee = bps("marketplace-fee-bps");
  if (!marketplace_fee) {
    return std::nullopt;
  }
  if (*marketplace_fee > options.engine.max_marketplace_fee_bps) {
    error = "--marketplace-fee-bps exceeds the 1000 bps cap";
    return std::nullopt;
  }
  options.engine.escrow_fee_bps = *escrow_fee;
  options.engine.marketplace_fee_bps = *marketplace_fee;

  options.engine.max_delegation_hops =
      vm["max-delegation-hops"].as<uint32_t>();
  if (options.engine.max_delegation_hops == 0) {
    error = "--max-delegation-hops must be positive";
    return std::nullopt;
  }
  options.engine.minimum_escrow_duration =
      vm["min-escrow-duration"].as<uint64_t>();
  return options;
}

}  // namespace covenant::config
