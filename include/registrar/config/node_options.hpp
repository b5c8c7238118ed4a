#pragma once

#include <spdlog/common.h>
#include <registrar/schema/orphan_policy.hpp>
#include <registrar/schema/primitives.hpp>
#include <optional>
#include <string>

namespace registrar::config {

/// Runtime settings for the registrar node.
///
/// Values come from the command line and, when `--config` names a file, from
/// an INI-style file using the same option names. Command-line values win.
struct node_options final {
  std::string grpc_address{"0.0.0.0:26658"};
  std::string db_path{"registrar.db"};
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::string log_file{"registrar.log"};
  bool strict_crypto{true};
  registrar::schema::hash32_t chain_id{};
  registrar::schema::orphan_policy_t on_revoke{
      registrar::schema::orphan_policy_t::preserve};
  bool verbose{false};
  bool show_help{false};
  std::string help_text;
};

/// Chain id used when none is configured: blake3("registrar-local-chain").
registrar::schema::hash32_t default_chain_id();

/// Parse node options. Returns std::nullopt and fills `error` when an option
/// is malformed or the config file cannot be read.
std::optional<node_options> parse_node_options(int argc,
                                               const char* const argv[],
                                               std::string& error);

}  // namespace registrar::config
