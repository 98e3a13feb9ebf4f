#pragma once

/*
 PeerLifecycleManager - registry of live peer sessions

 Purpose
 - Maintain the set of active peer sessions (inbound and outbound)
 - Enforce connection limits (max_inbound, max_outbound)
 - Allocate peer ids

 Ownership
 - Each session is owned by its own thread (NetworkManager holds the PeerPtr
   for the thread's lifetime). The registry keeps a weak control handle plus a
   snapshot of address/direction, so a session that is tearing down never
   keeps itself alive through the registry.

 Threading
 - All public methods are thread-safe. add_peer() serializes the limit check
   and the insert under add_mutex_, so concurrent accept and bootstrap threads
   cannot overshoot a limit.

 Notes
 - Ids are allocated monotonically starting at 1 and never reused
 - remove_peer() is idempotent
 - A rejected add_peer() leaves the registry unchanged; the caller closes the stream
*/

#include "network/peer.hpp"
#include "network/peer_tracking.hpp"
#include "network/protocol.hpp"
#include "util/threadsafe_containers.hpp"

#include <atomic>
#include <mutex>
#include <vector>

namespace bitwire {
namespace network {

class PeerLifecycleManager {
public:
  struct Config {
    size_t max_outbound_peers;
    size_t max_inbound_peers;

    Config()
        : max_outbound_peers(protocol::DEFAULT_MAX_OUTBOUND_CONNECTIONS),
          max_inbound_peers(protocol::DEFAULT_MAX_INBOUND_CONNECTIONS) {}
  };

  explicit PeerLifecycleManager(const Config& config = Config{});
  ~PeerLifecycleManager();

  PeerLifecycleManager(const PeerLifecycleManager&) = delete;
  PeerLifecycleManager& operator=(const PeerLifecycleManager&) = delete;

  // Register a session. Assigns and returns its id, or -1 if the
  // direction's limit is reached or the manager is shutting down.
  int add_peer(PeerPtr peer);

  // Remove a peer by ID (idempotent)
  void remove_peer(int peer_id);

  // Live session handle, nullptr if unknown or already destroyed
  PeerPtr get_peer(int peer_id) const;

  // Find peer ID by address:port. Returns -1 if not found.
  int find_peer_by_address(const std::string& address, uint16_t port) const;

  std::vector<PeerPtr> get_all_peers() const;
  std::vector<PeerPtr> get_ready_peers() const;

  size_t peer_count() const;
  size_t outbound_count() const;
  size_t inbound_count() const;

  bool needs_more_outbound() const;

  const Config& config() const { return config_; }

  // Interrupt every registered session and reject further add_peer() calls.
  // Entries are removed as their sessions close.
  void disconnect_all(DisconnectReason reason = DisconnectReason::Shutdown);

private:
  template <typename Pred>
  std::vector<PeerPtr> collect(Pred&& pred) const;

  Config config_;

  util::ThreadSafeMap<int, PeerTrackingData> peer_states_;

  // Monotonic; ids are not recycled within a process lifetime
  std::atomic<int> next_peer_id_{1};

  std::mutex add_mutex_;
  std::atomic<bool> stopping_all_{false};
};

}  // namespace network
}  // namespace bitwire
