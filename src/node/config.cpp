#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <warden/node/config.hpp>

#include <exception>
#include <fstream>
#include <iostream>
#include <string>

namespace po = boost::program_options;
using namespace warden::schema;

namespace warden::node {

namespace {

template <typename T, typename Parser>
bool assign(const po::variables_map& vm,
            const char* name,
            Parser&& parser,
            T& out) {
  if (!vm.contains(name)) {
    return true;
  }
  auto parsed = parser(vm[name].as<std::string>());
  if (!parsed) {
    spdlog::error("Invalid value for --{}: '{}'", name,
                  vm[name].as<std::string>());
    return false;
  }
  out = *parsed;
  return true;
}

}  // namespace

parse_result parse_config(int argc, char* argv[]) {
  auto settings = config{};
  auto config_file = std::string{};

  auto description = po::options_description{"Warden node"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with the same keys as the command-line options")(
      "grpc-address,g",
      po::value<std::string>(&settings.grpc_address)
          ->default_value(settings.grpc_address),
      "IP:Port for the gRPC node service")(
      "db-path,d",
      po::value<std::string>(&settings.db_path)->default_value(settings.db_path),
      "RocksDB directory")(
      "log-file,l",
      po::value<std::string>(&settings.log_file)
          ->default_value(settings.log_file),
      "Log file path")("chain-id", po::value<std::string>(),
                       "Chain id, 32 bytes hex")(
      "deployer", po::value<std::string>(),
      "Genesis deployer address, 20 bytes hex")(
      "protocol-admin", po::value<std::string>(),
      "Initial protocol admin address, 20 bytes hex")(
      "registrar-key", po::value<std::string>(),
      "Compressed secp256k1 registrar public key, 33 bytes hex")(
      "verbose,v", "Enable verbose output");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto input = std::ifstream{path};
      if (!input.good()) {
        spdlog::error("Failed opening config file '{}'", path);
        return parse_result{.exit_code = 1};
      }
      po::store(po::parse_config_file(input, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    spdlog::error("Invalid command line: {}", e.what());
    std::cout << description << std::endl;
    return parse_result{.exit_code = 1};
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return parse_result{.exit_code = 0};
  }

  settings.verbose = vm.contains("verbose");
  auto valid = assign(vm, "chain-id", try_make_hash32, settings.chain_id) &&
               assign(vm, "deployer", try_make_address, settings.deployer) &&
               assign(vm, "protocol-admin", try_make_address,
                      settings.protocol_admin) &&
               assign(vm, "registrar-key", try_make_registrar_key,
                      settings.registrar_key);
  if (!valid) {
    return parse_result{.exit_code = 1};
  }
  if (is_zero(settings.protocol_admin)) {
    spdlog::error("--protocol-admin is required");
    return parse_result{.exit_code = 1};
  }
  if (is_zero(settings.deployer)) {
    settings.deployer = settings.protocol_admin;
  }
  return parse_result{.settings = settings};
}

}  // namespace warden::node
