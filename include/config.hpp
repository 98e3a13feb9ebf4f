// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include "chain/chainparams.hpp"
#include "network/network_manager.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bitwire {
namespace app {

/**
 * NodeConfig - daemon settings
 *
 * Sources, lowest precedence first:
 *   1. built-in defaults
 *   2. bitcoin.conf-style file (key=value, '#' comments), path from --conf
 *      or <datadir>/bitwire.conf if present
 *   3. --key=value command-line flags
 *
 * Unknown keys and malformed values throw std::runtime_error naming the key.
 * "seednode" is repeatable; any seednode replaces the network's DNS seeds.
 */
struct NodeConfig {
  chain::ChainType chain_type{chain::ChainType::MAIN};
  std::optional<uint16_t> port;  // Defaults to the network's P2P port
  int32_t protocol_version{protocol::PROTOCOL_VERSION};
  uint64_t services{protocol::NODE_NETWORK};
  std::vector<std::string> seed_nodes;
  bool listen{true};
  size_t max_inbound{protocol::DEFAULT_MAX_INBOUND_CONNECTIONS};
  size_t max_outbound{protocol::DEFAULT_MAX_OUTBOUND_CONNECTIONS};
  int handshake_timeout_sec{protocol::VERSION_HANDSHAKE_TIMEOUT_SEC};
  std::string log_level{"info"};
  std::string log_file;  // Empty = console only; relative paths resolve against datadir
  std::filesystem::path datadir;
  std::filesystem::path conf_file;
  std::string user_agent{protocol::GetUserAgent()};

  bool show_help{false};
  bool show_version{false};

  // Apply one setting. Throws std::runtime_error on unknown key or bad value.
  void Set(const std::string& key, const std::string& value);

  // Apply every key=value line of a config file's contents
  void ParseFile(const std::string& contents);

  // Defaults, then config file, then flags
  static NodeConfig FromArgs(int argc, const char* const argv[]);

  // Full path of the log file, empty if file logging is off
  std::string ResolvedLogFile() const;

  network::NetworkManager::Config ToNetworkConfig(const chain::ChainParams& params) const;
};

std::string GetUsage(const char* program_name);

}  // namespace app
}  // namespace bitwire
