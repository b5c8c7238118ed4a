#include <boost/program_options.hpp>
#include <registrar/blake3/hash.hpp>
#include <registrar/config/node_options.hpp>

#include <fstream>
#include <sstream>
#include <string_view>

namespace po = boost::program_options;

namespace registrar::config {

namespace {

constexpr auto kDefaultChainSeed = std::string_view{"registrar-local-chain"};

po::options_description make_description(std::string& config_file) {
  auto description = po::options_description{"Registrar"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI-style file with any of the options below")(
      "grpc-address,g", po::value<std::string>()->default_value("0.0.0.0:26658"),
      "IP:Port for the ABCI server")(
      "db-path,d", po::value<std::string>()->default_value("registrar.db"),
      "RocksDB directory")(
      "log-level,l", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value("registrar.log"),
      "Log file path")(
      "strict-crypto", po::value<bool>()->default_value(true),
      "Verify transaction signatures")(
      "chain-id", po::value<std::string>(),
      "32-byte chain id hex (defaults to the local chain id)")(
      "orphan-policy", po::value<std::string>()->default_value("preserve"),
      "preserve|cascade pending transfer and history on revoke")(
      "verbose,v", "Enable verbose output");
  return description;
}

}  // namespace

registrar::schema::hash32_t default_chain_id() {
  return registrar::blake3::hash(kDefaultChainSeed);
}

std::optional<node_options> parse_node_options(const int argc,
                                               const char* const argv[],
                                               std::string& error) {
  auto config_file = std::string{};
  auto description = make_description(config_file);
  auto vm = po::variables_map{};
  try {
    // The first stored value for an option wins, so the command line is
    // stored before the config file.
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
    if (!config_file.empty()) {
      auto stream = std::ifstream{config_file};
      if (!stream) {
        error = "unable to read config file '" + config_file + "'";
        return std::nullopt;
      }
      po::store(po::parse_config_file(stream, description), vm);
      po::notify(vm);
    }
  } catch (const po::error& ex) {
    error = ex.what();
    return std::nullopt;
  }

  auto options = node_options{};
  auto help = std::ostringstream{};
  help << description;
  options.help_text = help.str();
  options.show_help = vm.contains("help");
  options.verbose = vm.contains("verbose");
  options.grpc_address = vm["grpc-address"].as<std::string>();
  options.db_path = vm["db-path"].as<std::string>();
  options.log_file = vm["log-file"].as<std::string>();
  options.strict_crypto = vm["strict-crypto"].as<bool>();

  auto level_name = vm["log-level"].as<std::string>();
  options.log_level = spdlog::level::from_str(level_name);
  // from_str maps unknown names to off; only "off" itself may mean off.
  if (options.log_level == spdlog::level::off && level_name != "off") {
    error = "invalid log-level '" + level_name + "'";
    return std::nullopt;
  }
  if (options.verbose && options.log_level > spdlog::level::debug) {
    options.log_level = spdlog::level::debug;
  }

  auto policy_name = vm["orphan-policy"].as<std::string>();
  auto policy =
      registrar::schema::try_from_string<registrar::schema::orphan_policy_t>(
          policy_name);
  if (!policy) {
    error = "invalid orphan-policy '" + policy_name + "'";
    return std::nullopt;
  }
  options.on_revoke = *policy;

  if (vm.contains("chain-id")) {
    auto chain_id = registrar::schema::try_make_hash32(
        vm["chain-id"].as<std::string>());
    if (!chain_id) {
      error = "chain-id must be 64 hex digits";
      return std::nullopt;
    }
    options.chain_id = *chain_id;
  } else {
    options.chain_id = default_chain_id();
  }

  return options;
}

}  // namespace registrar::config
