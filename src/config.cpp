// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "config.hpp"

#include "util/files.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace bitwire {
namespace app {

namespace {

std::string Trim(const std::string& s) {
  const char* ws = " \t\r\n";
  size_t begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

uint64_t ParseUnsigned(const std::string& key, const std::string& value, uint64_t max) {
  if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw std::runtime_error("Invalid value for '" + key + "': " + value);
  }
  try {
    unsigned long long parsed = std::stoull(value);
    if (parsed > max) {
      throw std::runtime_error("Value for '" + key + "' out of range: " + value);
    }
    return parsed;
  } catch (const std::out_of_range&) {
    throw std::runtime_error("Value for '" + key + "' out of range: " + value);
  }
}

bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "1" || value == "true" || value.empty()) {
    return true;
  }
  if (value == "0" || value == "false") {
    return false;
  }
  throw std::runtime_error("Invalid value for '" + key + "': " + value);
}

}  // namespace

void NodeConfig::Set(const std::string& key, const std::string& value) {
  if (key == "network") {
    auto type = chain::ChainTypeFromString(value);
    if (!type) {
      throw std::runtime_error("Invalid value for 'network': " + value + " (expected main, testnet3, regtest, signet)");
    }
    chain_type = *type;
  } else if (key == "testnet" || key == "regtest" || key == "signet") {
    // Shorthand flags (--regtest)
    if (ParseBool(key, value)) {
      chain_type = *chain::ChainTypeFromString(key);
    }
  } else if (key == "port") {
    port = static_cast<uint16_t>(ParseUnsigned(key, value, std::numeric_limits<uint16_t>::max()));
  } else if (key == "protocol") {
    protocol_version = static_cast<int32_t>(ParseUnsigned(key, value, std::numeric_limits<int32_t>::max()));
  } else if (key == "services") {
    services = ParseUnsigned(key, value, std::numeric_limits<uint64_t>::max());
  } else if (key == "seednode") {
    if (value.empty()) {
      throw std::runtime_error("Invalid value for 'seednode': empty");
    }
    seed_nodes.push_back(value);
  } else if (key == "listen") {
    listen = ParseBool(key, value);
  } else if (key == "maxinbound") {
    max_inbound = ParseUnsigned(key, value, 100000);
  } else if (key == "maxoutbound") {
    max_outbound = ParseUnsigned(key, value, 1000);
  } else if (key == "handshaketimeout") {
    handshake_timeout_sec = static_cast<int>(ParseUnsigned(key, value, 3600));
    if (handshake_timeout_sec == 0) {
      throw std::runtime_error("Invalid value for 'handshaketimeout': must be positive");
    }
  } else if (key == "loglevel") {
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (std::find(std::begin(levels), std::end(levels), value) == std::end(levels)) {
      throw std::runtime_error("Invalid value for 'loglevel': " + value);
    }
    log_level = value;
  } else if (key == "logfile") {
    log_file = value;
  } else if (key == "datadir") {
    if (value.empty()) {
      throw std::runtime_error("Invalid value for 'datadir': empty");
    }
    datadir = value;
  } else if (key == "conf") {
    conf_file = value;
  } else if (key == "useragent") {
    if (value.size() > protocol::MAX_SUBVERSION_LENGTH) {
      throw std::runtime_error("Value for 'useragent' longer than " +
                               std::to_string(protocol::MAX_SUBVERSION_LENGTH) + " bytes");
    }
    user_agent = value;
  } else {
    throw std::runtime_error("Unknown configuration key: '" + key + "'");
  }
}

void NodeConfig::ParseFile(const std::string& contents) {
  std::istringstream stream(contents);
  std::string line;
  int line_number = 0;
  while (std::getline(stream, line)) {
    line_number++;
    size_t hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    size_t eq = line.find('=');
    if (eq == std::string::npos) {
      throw std::runtime_error("Config line " + std::to_string(line_number) + ": expected key=value: " + line);
    }
    std::string key = Trim(line.substr(0, eq));
    if (key == "conf") {
      throw std::runtime_error("Config line " + std::to_string(line_number) + ": 'conf' not allowed in config file");
    }
    Set(key, Trim(line.substr(eq + 1)));
  }
}

NodeConfig NodeConfig::FromArgs(int argc, const char* const argv[]) {
  NodeConfig config;

  // Collect flags first: conf and datadir decide which file is read
  std::vector<std::pair<std::string, std::string>> flags;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
      continue;
    }
    if (arg == "--version" || arg == "-v") {
      config.show_version = true;
      continue;
    }
    if (arg.rfind("--", 0) != 0) {
      throw std::runtime_error("Unexpected argument: " + arg);
    }
    arg = arg.substr(2);
    size_t eq = arg.find('=');
    if (eq == std::string::npos) {
      flags.emplace_back(arg, "");
    } else {
      flags.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
    }
  }
  if (config.show_help || config.show_version) {
    return config;
  }

  NodeConfig from_flags;
  for (const auto& [key, value] : flags) {
    if (key == "conf" || key == "datadir") {
      from_flags.Set(key, value);
    }
  }
  config.datadir = from_flags.datadir.empty() ? util::get_default_datadir() : from_flags.datadir;

  std::filesystem::path conf_path = from_flags.conf_file;
  bool explicit_conf = !conf_path.empty();
  if (!explicit_conf && !config.datadir.empty()) {
    conf_path = config.datadir / "bitwire.conf";
  }
  if (!conf_path.empty()) {
    auto contents = util::read_file_string(conf_path);
    if (contents) {
      config.ParseFile(*contents);
    } else if (explicit_conf) {
      throw std::runtime_error("Cannot read config file: " + conf_path.string());
    }
  }

  // Flags override the file; repeated seednode flags replace the file's list
  bool seeds_from_flags = false;
  for (const auto& [key, value] : flags) {
    if (key == "seednode" && !seeds_from_flags) {
      config.seed_nodes.clear();
      seeds_from_flags = true;
    }
    config.Set(key, value);
  }
  if (!from_flags.datadir.empty()) {
    config.datadir = from_flags.datadir;
  }
  config.conf_file = conf_path;
  return config;
}

std::string NodeConfig::ResolvedLogFile() const {
  if (log_file.empty()) {
    return "";
  }
  std::filesystem::path path(log_file);
  if (path.is_relative() && !datadir.empty()) {
    path = datadir / path;
  }
  return path.string();
}

network::NetworkManager::Config NodeConfig::ToNetworkConfig(const chain::ChainParams& params) const {
  network::NetworkManager::Config net;
  net.network_magic = params.GetNetworkMagic();
  net.default_port = params.GetDefaultPort();
  net.listen_port = port.value_or(params.GetDefaultPort());
  net.listen_enabled = listen;
  net.seeds = seed_nodes.empty() ? params.DNSSeeds() : seed_nodes;
  net.protocol_version = protocol_version;
  net.local_services = services;
  net.user_agent = user_agent;
  net.max_inbound_connections = max_inbound;
  net.max_outbound_connections = max_outbound;
  net.handshake_timeout = std::chrono::seconds(handshake_timeout_sec);
  return net;
}

std::string GetUsage(const char* program_name) {
  std::ostringstream out;
  out << "bitwire - Bitcoin P2P protocol daemon\n\n"
      << "Usage: " << program_name << " [options]\n\n"
      << "Options:\n"
      << "  --conf=<file>              Config file (default: <datadir>/bitwire.conf)\n"
      << "  --datadir=<path>           Data directory (default: ~/.bitwire)\n"
      << "  --network=<name>           main, testnet3, regtest or signet (default: main)\n"
      << "  --regtest | --testnet | --signet   Network shorthands\n"
      << "  --port=<port>              Listen port (default: network P2P port)\n"
      << "  --listen=<0|1>             Accept inbound connections (default: 1)\n"
      << "  --seednode=<host[:port]>   Seed to bootstrap from (repeatable, replaces DNS seeds)\n"
      << "  --maxinbound=<n>           Max inbound connections (default: 125)\n"
      << "  --maxoutbound=<n>          Max outbound connections (default: 10)\n"
      << "  --protocol=<version>       Advertised protocol version (default: 70015)\n"
      << "  --services=<flags>         Advertised service bits (default: 1)\n"
      << "  --handshaketimeout=<sec>   Handshake timeout (default: 60)\n"
      << "  --useragent=<string>       BIP 14 user agent\n"
      << "  --loglevel=<level>         trace, debug, info, warn, error, critical, off (default: info)\n"
      << "  --logfile=<path>           Also log to file (relative to datadir)\n"
      << "  --version                  Show version information\n"
      << "  --help                     Show this help message\n";
  return out.str();
}

}  // namespace app
}  // namespace bitwire
