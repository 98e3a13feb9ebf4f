// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"

#include "version.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace bitwire {
namespace protocol {

// Protocol version we speak (BIP 133 feefilter, BIP 130 sendheaders)
constexpr int32_t PROTOCOL_VERSION = 70015;

// Network magic - written little-endian, so mainnet reads F9 BE B4 D9 on the wire
namespace magic {
constexpr uint32_t MAINNET = 0xD9B4BEF9;
constexpr uint32_t TESTNET3 = 0x0709110B;
constexpr uint32_t REGTEST = 0xDAB5BFFA;
constexpr uint32_t SIGNET = 0x40CF030A;
}  // namespace magic

namespace ports {
constexpr uint16_t MAINNET = 8333;
constexpr uint16_t TESTNET3 = 18333;
constexpr uint16_t REGTEST = 18444;
constexpr uint16_t SIGNET = 38333;
}  // namespace ports

// Service flags - what services this node provides
enum ServiceFlags : uint64_t {
  NODE_NONE = 0,
  NODE_NETWORK = (1 << 0),          // Full block history
  NODE_GETUTXO = (1 << 1),          // BIP 64
  NODE_BLOOM = (1 << 2),            // BIP 111
  NODE_WITNESS = (1 << 3),          // BIP 144
  NODE_NETWORK_LIMITED = (1 << 10)  // BIP 159, last 288 blocks
};

// Message types - 12 bytes, null-padded
namespace commands {
// Handshake
constexpr const char* VERSION = "version";
constexpr const char* VERACK = "verack";

// Peer discovery
constexpr const char* ADDR = "addr";
constexpr const char* GETADDR = "getaddr";

// Inventory
constexpr const char* INV = "inv";
constexpr const char* GETDATA = "getdata";
constexpr const char* NOTFOUND = "notfound";

// Blocks and headers
constexpr const char* GETBLOCKS = "getblocks";
constexpr const char* GETHEADERS = "getheaders";
constexpr const char* HEADERS = "headers";
constexpr const char* BLOCK = "block";
constexpr const char* SENDHEADERS = "sendheaders";

// Transactions
constexpr const char* TX = "tx";
constexpr const char* MEMPOOL = "mempool";
constexpr const char* FEEFILTER = "feefilter";

// Keep-alive
constexpr const char* PING = "ping";
constexpr const char* PONG = "pong";

constexpr const char* REJECT = "reject";

// BIP 37 bloom filters (recognized, not handled)
constexpr const char* FILTERLOAD = "filterload";
constexpr const char* FILTERADD = "filteradd";
constexpr const char* FILTERCLEAR = "filterclear";
constexpr const char* MERKLEBLOCK = "merkleblock";

// BIP 152 compact blocks (only sendcmpct is parsed)
constexpr const char* SENDCMPCT = "sendcmpct";
constexpr const char* CMPCTBLOCK = "cmpctblock";
constexpr const char* GETBLOCKTXN = "getblocktxn";
constexpr const char* BLOCKTXN = "blocktxn";
}  // namespace commands

// True for any of the 26 command names above
[[nodiscard]] bool IsKnownCommand(const std::string& command);

// Message header constants
constexpr size_t MESSAGE_HEADER_SIZE = 24;
constexpr size_t COMMAND_SIZE = 12;
constexpr size_t CHECKSUM_SIZE = 4;

// ============================================================================
// SECURITY LIMITS
// ============================================================================

// Serialization limits
constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB - Maximum CompactSize value accepted

// Network message limits
constexpr size_t MAX_PROTOCOL_MESSAGE_LENGTH = 4 * 1000 * 1000;  // 4 MB - Single message limit

// Protocol-specific limits
constexpr unsigned int MAX_LOCATOR_SZ = 101;   // GETHEADERS/GETBLOCKS locator limit
constexpr uint32_t MAX_HEADERS_SIZE = 2000;    // Headers per response
constexpr uint32_t MAX_ADDR_SIZE = 1000;       // Addresses per ADDR message
constexpr uint32_t MAX_INV_SIZE = 50000;       // Entries per INV/GETDATA/NOTFOUND
constexpr size_t MAX_SUBVERSION_LENGTH = 256;  // user_agent
constexpr size_t MAX_REJECT_MESSAGE_LENGTH = 111;

// Connection limits
constexpr unsigned int DEFAULT_MAX_OUTBOUND_CONNECTIONS = 10;
constexpr unsigned int DEFAULT_MAX_INBOUND_CONNECTIONS = 125;
constexpr size_t MAX_ADDRESSES_PER_SEED = 5;
constexpr size_t MAX_KNOWN_ADDRESSES = 1000;
constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 10 * 1000 * 1000;  // 10 MB - Send queue limit per peer

// Timeouts and intervals (in seconds)
constexpr int VERSION_HANDSHAKE_TIMEOUT_SEC = 60;  // 1 minute for handshake
constexpr int PING_INTERVAL_SEC = 120;             // 2 minutes between pings
constexpr int PING_TIMEOUT_SEC = 20 * 60;          // 20 minutes - peer must respond to ping
constexpr int INACTIVITY_TIMEOUT_SEC = 20 * 60;    // 20 minutes
constexpr int CONNECT_TIMEOUT_SEC = 5;
constexpr int MAINTENANCE_INTERVAL_SEC = 10;

// Blocking stream operations wake up this often to observe shutdown
constexpr int STREAM_POLL_INTERVAL_MS = 200;

// How long a closing session lets its writer flush already-queued frames
constexpr int SEND_FLUSH_TIMEOUT_MS = 1000;

inline std::string GetUserAgent() {
  return bitwire::GetUserAgent();
}

// Message header structure (24 bytes):
// magic (4 bytes), command (12 bytes null-padded), length (4 bytes), checksum (4 bytes)
struct MessageHeader {
  uint32_t magic;
  std::array<char, COMMAND_SIZE> command;
  uint32_t length;
  std::array<uint8_t, CHECKSUM_SIZE> checksum;

  MessageHeader() noexcept;
  MessageHeader(uint32_t magic, const std::string& cmd, uint32_t len);

  // Get command as string (strips null padding)
  [[nodiscard]] std::string get_command() const;

  // Set command from string (adds null padding, truncates to 12 bytes)
  void set_command(const std::string& cmd);
};

// Network address structure (26 bytes on wire: 8 services + 16 IP + 2 port)
struct NetworkAddress {
  uint64_t services;
  std::array<uint8_t, 16> ip;  // IPv6 format (IPv4 mapped)
  uint16_t port;               // Host byte order; big-endian on the wire

  NetworkAddress() noexcept;
  NetworkAddress(uint64_t svcs, const std::array<uint8_t, 16>& addr, uint16_t p) noexcept;

  // Helper to create from IP string (supports both IPv4 and IPv6)
  [[nodiscard]] static NetworkAddress from_string(const std::string& ip_str, uint16_t port,
                                                  uint64_t services = NODE_NONE);

  // Check if this is a zeroed/invalid address (all bytes are 0)
  // Used to detect parse failures from from_string()
  [[nodiscard]] bool is_zero() const noexcept;

  // Convert to IP string (IPv4 or IPv6)
  // Returns std::nullopt if conversion fails
  [[nodiscard]] std::optional<std::string> to_string() const noexcept;

  // Identity is IP + port; services is metadata
  [[nodiscard]] bool operator<(const NetworkAddress& other) const noexcept;
  [[nodiscard]] bool operator==(const NetworkAddress& other) const noexcept;
};

// Timestamped network address (30 bytes: 4 timestamp + 26 NetworkAddress)
struct TimestampedAddress {
  uint32_t timestamp;
  NetworkAddress address;

  TimestampedAddress() noexcept;
  TimestampedAddress(uint32_t ts, const NetworkAddress& addr) noexcept;
};

enum class InventoryType : uint32_t {
  ERROR = 0,
  MSG_TX = 1,
  MSG_BLOCK = 2,
  MSG_FILTERED_BLOCK = 3,
  MSG_CMPCT_BLOCK = 4,
  MSG_WITNESS_TX = 0x40000001,
  MSG_WITNESS_BLOCK = 0x40000002,
};

// Inventory vector (36 bytes: 4 type + 32 hash)
struct InventoryVector {
  InventoryType type;
  uint256 hash;

  InventoryVector() noexcept;
  InventoryVector(InventoryType t, const uint256& h) noexcept;

  [[nodiscard]] bool is_tx() const noexcept {
    return type == InventoryType::MSG_TX || type == InventoryType::MSG_WITNESS_TX;
  }
  [[nodiscard]] bool is_block() const noexcept {
    return type == InventoryType::MSG_BLOCK || type == InventoryType::MSG_WITNESS_BLOCK;
  }

  bool operator==(const InventoryVector& other) const noexcept { return type == other.type && hash == other.hash; }
};

}  // namespace protocol
}  // namespace bitwire
