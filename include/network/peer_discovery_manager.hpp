#pragma once

/*
 PeerDiscoveryManager - seed resolution and known-address set

 Purpose
 - Turn configured seed hosts into dialable endpoints (DNS via asio resolver,
   literal IPs and host:port accepted for local testing)
 - Keep addresses learned from ADDR in a bounded set and serve them on GETADDR

 Key responsibilities
 1. ResolveSeed: at most MAX_ADDRESSES_PER_SEED endpoints per seed host
 2. HandleAddr / HandleGetAddr: ADDR/GETADDR message handlers
 3. Once-per-connection GETADDR reply

 Threading
 - All public methods are thread-safe (mutex_). ResolveSeed blocks on DNS and
   touches no shared state.
*/

#include "network/message.hpp"
#include "network/peer.hpp"
#include "network/protocol.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace bitwire {
namespace network {

// One dialable endpoint produced from a seed entry
struct SeedAddress {
  std::string address;  // Numeric IP text
  uint16_t port{0};

  bool operator==(const SeedAddress& other) const { return address == other.address && port == other.port; }
};

class PeerDiscoveryManager {
public:
  explicit PeerDiscoveryManager(size_t max_known_addresses = protocol::MAX_KNOWN_ADDRESSES);
  ~PeerDiscoveryManager() = default;

  // Non-copyable
  PeerDiscoveryManager(const PeerDiscoveryManager&) = delete;
  PeerDiscoveryManager& operator=(const PeerDiscoveryManager&) = delete;

  // Split "host", "host:port", "[v6]:port" or a bare IPv6 literal.
  // Returns false on a malformed port.
  static bool ParseSeed(const std::string& seed, uint16_t default_port, std::string& host, uint16_t& port);

  // Resolve a seed entry to at most MAX_ADDRESSES_PER_SEED distinct endpoints.
  // Resolution failures are logged and yield an empty list.
  static std::vector<SeedAddress> ResolveSeed(const std::string& seed, uint16_t default_port);

  // === Protocol Message Handlers ===

  bool HandleAddr(PeerPtr peer, message::AddrMessage* msg);
  bool HandleGetAddr(PeerPtr peer);

  // Forget per-connection state
  void OnPeerDisconnected(int peer_id);

  // === Known-address set ===

  // Add routable addresses (zero IP or port are skipped). When full, the entry
  // with the oldest timestamp is replaced. Returns the number of new entries.
  size_t AddAddresses(const std::vector<protocol::TimestampedAddress>& addresses);

  // Newest first, at most max_count
  std::vector<protocol::TimestampedAddress> GetAddresses(size_t max_count = protocol::MAX_ADDR_SIZE) const;

  size_t Size() const;
  void Clear();

private:
  const size_t max_known_;

  mutable std::mutex mutex_;
  std::map<protocol::NetworkAddress, protocol::TimestampedAddress> known_;  // Guarded by mutex_
  std::set<int> getaddr_replied_;                                          // Guarded by mutex_
};

}  // namespace network
}  // namespace bitwire
