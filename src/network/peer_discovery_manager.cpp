// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "network/peer_discovery_manager.hpp"

#include "util/logging.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <limits>

#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/tcp.hpp>

namespace bitwire {
namespace network {

PeerDiscoveryManager::PeerDiscoveryManager(size_t max_known_addresses) : max_known_(max_known_addresses) {}

bool PeerDiscoveryManager::ParseSeed(const std::string& seed, uint16_t default_port, std::string& host,
                                     uint16_t& port) {
  host = seed;
  port = default_port;
  std::string port_str;

  if (!seed.empty() && seed.front() == '[') {
    // [v6] or [v6]:port
    size_t close = seed.find(']');
    if (close == std::string::npos) {
      return false;
    }
    host = seed.substr(1, close - 1);
    if (close + 1 < seed.size()) {
      if (seed[close + 1] != ':') {
        return false;
      }
      port_str = seed.substr(close + 2);
    }
  } else {
    size_t colon = seed.find(':');
    // More than one colon without brackets: bare IPv6 literal, default port
    if (colon != std::string::npos && seed.find(':', colon + 1) == std::string::npos) {
      host = seed.substr(0, colon);
      port_str = seed.substr(colon + 1);
    }
  }

  if (host.empty()) {
    return false;
  }
  if (port_str.empty()) {
    return true;
  }

  try {
    size_t pos = 0;
    int value = std::stoi(port_str, &pos);
    if (pos != port_str.size() || value <= 0 || value > std::numeric_limits<uint16_t>::max()) {
      return false;
    }
    port = static_cast<uint16_t>(value);
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

std::vector<SeedAddress> PeerDiscoveryManager::ResolveSeed(const std::string& seed, uint16_t default_port) {
  std::vector<SeedAddress> result;

  std::string host;
  uint16_t port = 0;
  if (!ParseSeed(seed, default_port, host, port)) {
    LOG_NET_WARN("Invalid seed format: {}", seed);
    return result;
  }

  // Literal IP: no DNS round trip
  asio::error_code ec;
  asio::ip::address literal = asio::ip::make_address(host, ec);
  if (!ec) {
    result.push_back(SeedAddress{literal.to_string(), port});
    return result;
  }

  asio::io_context io_context;
  asio::ip::tcp::resolver resolver(io_context);
  auto endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    LOG_NET_WARN("Failed to resolve seed {}: {}", host, ec.message());
    return result;
  }

  for (const auto& entry : endpoints) {
    auto address = entry.endpoint().address();
    if (address.is_v6() && address.to_v6().is_v4_mapped()) {
      address = asio::ip::make_address_v4(asio::ip::v4_mapped, address.to_v6());
    }
    SeedAddress candidate{address.to_string(), port};
    if (std::find(result.begin(), result.end(), candidate) != result.end()) {
      continue;
    }
    result.push_back(std::move(candidate));
    if (result.size() >= protocol::MAX_ADDRESSES_PER_SEED) {
      break;
    }
  }

  LOG_NET_DEBUG("Seed {} resolved to {} addresses", host, result.size());
  return result;
}

bool PeerDiscoveryManager::HandleAddr(PeerPtr peer, message::AddrMessage* msg) {
  if (!msg || !peer) {
    return false;
  }

  // Oversized ADDR messages are rejected at deserialization
  size_t added = AddAddresses(msg->addresses);
  LOG_NET_DEBUG("Received {} addresses from peer={} ({} new, {} known)", msg->addresses.size(), peer->id(), added,
                Size());
  return true;
}

bool PeerDiscoveryManager::HandleGetAddr(PeerPtr peer) {
  if (!peer) {
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!getaddr_replied_.insert(peer->id()).second) {
      LOG_NET_DEBUG("GETADDR ignored: repeat on same connection peer={}", peer->id());
      return true;
    }
  }

  message::AddrMessage response;
  response.addresses = GetAddresses(protocol::MAX_ADDR_SIZE);
  LOG_NET_DEBUG("Serving {} addresses to peer={}", response.addresses.size(), peer->id());
  peer->send_message(response);
  return true;
}

void PeerDiscoveryManager::OnPeerDisconnected(int peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  getaddr_replied_.erase(peer_id);
}

size_t PeerDiscoveryManager::AddAddresses(const std::vector<protocol::TimestampedAddress>& addresses) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t added = 0;

  for (const auto& entry : addresses) {
    if (entry.address.is_zero() || entry.address.port == 0) {
      continue;
    }

    auto it = known_.find(entry.address);
    if (it != known_.end()) {
      // Refresh timestamp and services
      if (entry.timestamp > it->second.timestamp) {
        it->second = entry;
      }
      continue;
    }

    if (max_known_ == 0) {
      break;
    }
    if (known_.size() >= max_known_) {
      auto oldest = std::min_element(known_.begin(), known_.end(), [](const auto& a, const auto& b) {
        return a.second.timestamp < b.second.timestamp;
      });
      known_.erase(oldest);
    }
    known_.emplace(entry.address, entry);
    added++;
  }
  return added;
}

std::vector<protocol::TimestampedAddress> PeerDiscoveryManager::GetAddresses(size_t max_count) const {
  std::vector<protocol::TimestampedAddress> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(known_.size());
    for (const auto& [addr, entry] : known_) {
      result.push_back(entry);
    }
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const auto& a, const auto& b) { return a.timestamp > b.timestamp; });
  if (result.size() > max_count) {
    result.resize(max_count);
  }
  return result;
}

size_t PeerDiscoveryManager::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return known_.size();
}

void PeerDiscoveryManager::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  known_.clear();
  getaddr_replied_.clear();
}

}  // namespace network
}  // namespace bitwire
