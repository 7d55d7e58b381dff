#pragma once

#include <warden/schema/primitives.hpp>

#include <optional>
#include <string>

namespace warden::node {

struct config final {
  std::string grpc_address{"0.0.0.0:26658"};
  std::string db_path{"warden.db"};
  std::string log_file{"warden.log"};
  warden::schema::hash32_t chain_id{};
  /// Account that submits the genesis deployments.
  warden::schema::address_t deployer{};
  warden::schema::address_t protocol_admin{};
  warden::schema::registrar_key_t registrar_key{};
  bool verbose{};
};

/// Outcome of command-line parsing: a config to run with, or an exit code
/// when the process should stop (help printed or invalid input).
struct parse_result final {
  std::optional<config> settings;
  int exit_code{};
};

/// Parse command-line options and the optional `--config` INI file.
/// Command-line values take precedence over file values.
parse_result parse_config(int argc, char* argv[]);

}  // namespace warden::node
