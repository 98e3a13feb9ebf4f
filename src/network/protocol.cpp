// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "network/protocol.hpp"

#include <algorithm>
#include <cstring>
#include <tuple>
#include <unordered_set>

#include <asio/ip/address.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/address_v6.hpp>

namespace bitwire {
namespace protocol {

bool IsKnownCommand(const std::string& command) {
  // Everything a Bitcoin Core peer may send us, modelled or not
  static const std::unordered_set<std::string> known = {
      commands::VERSION,     commands::VERACK,     commands::ADDR,        commands::INV,
      commands::GETDATA,     commands::NOTFOUND,   commands::GETBLOCKS,   commands::GETHEADERS,
      commands::TX,          commands::BLOCK,      commands::HEADERS,     commands::GETADDR,
      commands::MEMPOOL,     commands::PING,       commands::PONG,        commands::REJECT,
      commands::FILTERLOAD,  commands::FILTERADD,  commands::FILTERCLEAR, commands::MERKLEBLOCK,
      commands::SENDHEADERS, commands::FEEFILTER,  commands::SENDCMPCT,   commands::CMPCTBLOCK,
      commands::GETBLOCKTXN, commands::BLOCKTXN};
  return known.find(command) != known.end();
}

// === MessageHeader ===

MessageHeader::MessageHeader() noexcept : magic(0), command{}, length(0), checksum{} {}

MessageHeader::MessageHeader(uint32_t magic, const std::string& cmd, uint32_t len)
    : magic(magic), command{}, length(len), checksum{} {
  set_command(cmd);
}

std::string MessageHeader::get_command() const {
  // Up to the first NUL, or all 12 bytes if the name fills the field
  const char* begin = command.data();
  return std::string(begin, std::find(begin, begin + COMMAND_SIZE, '\0'));
}

void MessageHeader::set_command(const std::string& cmd) {
  command.fill('\0');
  std::memcpy(command.data(), cmd.data(), std::min(cmd.size(), COMMAND_SIZE));
}

// === NetworkAddress ===

NetworkAddress::NetworkAddress() noexcept : services(NODE_NONE), ip{}, port(0) {}

NetworkAddress::NetworkAddress(uint64_t svcs, const std::array<uint8_t, 16>& addr, uint16_t p) noexcept
    : services(svcs), ip(addr), port(p) {}

NetworkAddress NetworkAddress::from_string(const std::string& ip_str, uint16_t port, uint64_t services) {
  NetworkAddress addr;
  addr.services = services;
  addr.port = port;

  asio::error_code ec;
  const asio::ip::address parsed = asio::ip::make_address(ip_str, ec);
  if (ec) {
    // Left all-zero so callers can detect the failure with is_zero()
    return addr;
  }

  // IPv4 is stored as ::ffff:a.b.c.d
  const asio::ip::address_v6 v6 =
      parsed.is_v4() ? asio::ip::make_address_v6(asio::ip::v4_mapped, parsed.to_v4()) : parsed.to_v6();
  const auto bytes = v6.to_bytes();
  std::copy(bytes.begin(), bytes.end(), addr.ip.begin());
  return addr;
}

bool NetworkAddress::is_zero() const noexcept {
  return std::all_of(ip.begin(), ip.end(), [](uint8_t b) { return b == 0; });
}

std::optional<std::string> NetworkAddress::to_string() const noexcept {
  try {
    asio::ip::address_v6::bytes_type bytes;
    std::copy(ip.begin(), ip.end(), bytes.begin());
    const asio::ip::address_v6 v6(bytes);
    if (v6.is_v4_mapped()) {
      return asio::ip::make_address_v4(asio::ip::v4_mapped, v6).to_string();
    }
    return v6.to_string();
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// Peer identity is IP + port; services is metadata
bool NetworkAddress::operator<(const NetworkAddress& other) const noexcept {
  return std::tie(ip, port) < std::tie(other.ip, other.port);
}

bool NetworkAddress::operator==(const NetworkAddress& other) const noexcept {
  return std::tie(ip, port) == std::tie(other.ip, other.port);
}

// === TimestampedAddress / InventoryVector ===

TimestampedAddress::TimestampedAddress() noexcept : timestamp(0) {}

TimestampedAddress::TimestampedAddress(uint32_t ts, const NetworkAddress& addr) noexcept
    : timestamp(ts), address(addr) {}

InventoryVector::InventoryVector() noexcept : type(InventoryType::ERROR), hash() {}

InventoryVector::InventoryVector(InventoryType t, const uint256& h) noexcept : type(t), hash(h) {}

}  // namespace protocol
}  // namespace bitwire
