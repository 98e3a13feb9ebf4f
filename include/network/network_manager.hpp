#pragma once

#include "network/peer.hpp"
#include "network/peer_lifecycle_manager.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Forward declarations
class uint256;
class CBlockHeader;

namespace bitwire {

namespace chain {
class BlockStoreInterface;
class MempoolInterface;
}  // namespace chain

namespace message {
class AddrMessage;
class BlockMessage;
class GetDataMessage;
class HeadersMessage;
class InvMessage;
class LocatorMessage;
class Message;
class RejectMessage;
class TxMessage;
}  // namespace message

namespace network {

// Connection result codes
enum class ConnectionResult { Success, NotRunning, NoSlotsAvailable, TransportFailed };

// Forward declarations
class MessageDispatcher;
class PeerDiscoveryManager;

// Default configuration constants
static constexpr std::chrono::seconds DEFAULT_MAINTENANCE_INTERVAL{protocol::MAINTENANCE_INTERVAL_SEC};
static constexpr std::chrono::seconds DEFAULT_CONNECT_TIMEOUT{protocol::CONNECT_TIMEOUT_SEC};
static constexpr std::chrono::seconds DEFAULT_PING_INTERVAL{protocol::PING_INTERVAL_SEC};
static constexpr std::chrono::seconds DEFAULT_PING_TIMEOUT{protocol::PING_TIMEOUT_SEC};

// NetworkManager - Top-level coordinator for all networking (inspired by Bitcoin's CConnman)
// Owns the transport, the peer registry, seed discovery and message routing.
//
// Thread-per-peer model:
// - every session (inbound or outbound) runs Peer::run() on its own thread
// - accept thread: waits on the listener and spawns inbound sessions
// - bootstrap thread: resolves seeds and dials outbound sessions
// - maintenance thread: keepalive pings, ping timeouts, reaping finished sessions
// Every blocking call polls for interruption, so stop() returns once the
// slowest in-flight operation (at most one connect timeout) has unwound.
class NetworkManager {
public:
  struct Config {
    uint32_t network_magic;                 // Network magic bytes
    uint16_t default_port;                  // Port dialed for seeds given without one
    uint16_t listen_port;                   // Port to listen on (0 = ephemeral)
    bool listen_enabled;                    // Enable inbound connections
    std::vector<std::string> seeds;         // DNS seeds, literal IPs or host:port

    int32_t protocol_version;
    uint64_t local_services;
    std::string user_agent;

    size_t max_inbound_connections;
    size_t max_outbound_connections;

    std::chrono::milliseconds handshake_timeout;
    std::chrono::milliseconds inactivity_timeout;
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds maintenance_interval;
    std::chrono::milliseconds ping_interval;
    std::chrono::milliseconds ping_timeout;

    // Test-only: Override for deterministic nonce (production uses random)
    std::optional<uint64_t> test_nonce;

    Config()
        : network_magic(protocol::magic::MAINNET), default_port(protocol::ports::MAINNET),
          listen_port(protocol::ports::MAINNET), listen_enabled(true), protocol_version(protocol::PROTOCOL_VERSION),
          local_services(protocol::NODE_NETWORK), user_agent(protocol::GetUserAgent()),
          max_inbound_connections(protocol::DEFAULT_MAX_INBOUND_CONNECTIONS),
          max_outbound_connections(protocol::DEFAULT_MAX_OUTBOUND_CONNECTIONS),
          handshake_timeout(std::chrono::seconds(protocol::VERSION_HANDSHAKE_TIMEOUT_SEC)),
          inactivity_timeout(std::chrono::seconds(protocol::INACTIVITY_TIMEOUT_SEC)),
          connect_timeout(DEFAULT_CONNECT_TIMEOUT), maintenance_interval(DEFAULT_MAINTENANCE_INTERVAL),
          ping_interval(DEFAULT_PING_INTERVAL), ping_timeout(DEFAULT_PING_TIMEOUT), test_nonce(std::nullopt) {}
  };

  // transport == nullptr creates a TCP transport
  NetworkManager(chain::MempoolInterface& mempool, chain::BlockStoreInterface& block_store,
                 const Config& config = Config{}, std::shared_ptr<Transport> transport = nullptr);
  ~NetworkManager();

  NetworkManager(const NetworkManager&) = delete;
  NetworkManager& operator=(const NetworkManager&) = delete;

  // Lifecycle. start() returns false if already running or the listen port cannot be bound.
  bool start();

  /**
   * Stop NetworkManager and join every thread it started
   *
   * - Closes the listener, interrupts every session stream, joins accept,
   *   bootstrap, maintenance and all session threads
   * - May block up to connect_timeout if a dial is in flight
   * - Safe to call multiple times (idempotent)
   */
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }

  // Component access
  PeerLifecycleManager& peer_manager() { return *peer_manager_; }
  PeerDiscoveryManager& discovery_manager() { return *discovery_manager_; }

  // Dial and start an outbound session (blocks for at most connect_timeout)
  ConnectionResult connect_to(const std::string& address, uint16_t port);

  // Start a session over an already-established stream. Returns nullptr if the
  // manager is stopped or the direction's limit is reached (stream is closed).
  PeerPtr add_connection(ByteStreamPtr stream, PeerDirection direction);

  // Returns true if peer existed and was asked to disconnect
  bool disconnect_from(int peer_id);

  // Queue for every READY peer except exclude_peer_id. Returns the number of peers queued to.
  size_t broadcast(const message::Message& msg, int exclude_peer_id = -1);

  // Announce a transaction (inv) to every READY peer except the source and
  // peers whose VERSION asked for no transaction relay
  size_t relay_transaction(const uint256& txid, int exclude_peer_id = -1);

  // Announce a block: headers to peers that sent sendheaders, inv otherwise
  size_t relay_block(const CBlockHeader& header, int exclude_peer_id = -1);

  uint64_t get_local_nonce() const { return local_nonce_; }

  // Bound listen port (0 if not listening)
  uint16_t listening_port() const;

  // Connection stats
  size_t active_peer_count() const;
  size_t outbound_peer_count() const;
  size_t inbound_peer_count() const;
  size_t session_thread_count() const;

  // Test-only: run one maintenance pass synchronously
  // This method is intentionally public but should only be used in tests
  void test_hook_run_maintenance() { run_maintenance(); }

  // Test-only: Access dispatcher for diagnostics
  // This method is intentionally public but should only be used in tests
  MessageDispatcher& dispatcher_for_test() { return *message_dispatcher_; }

private:
  // One session thread; done is set after Peer::run() returns
  struct Session {
    PeerPtr peer;
    std::thread thread;
    std::atomic<bool> done{false};
  };

  Config config_;
  std::atomic<bool> running_{false};
  std::mutex start_stop_mutex_;  // Serializes start/stop

  // Process-wide VERSION nonce
  uint64_t local_nonce_;

  // Transport layer (real TCP or a test double)
  std::shared_ptr<Transport> transport_;
  bool listening_{false};

  // Collaborators
  chain::MempoolInterface& mempool_;
  chain::BlockStoreInterface& block_store_;

  // Components
  std::unique_ptr<PeerLifecycleManager> peer_manager_;
  std::unique_ptr<PeerDiscoveryManager> discovery_manager_;
  std::unique_ptr<MessageDispatcher> message_dispatcher_;

  // Threads
  std::thread accept_thread_;
  std::thread bootstrap_thread_;
  std::thread maintenance_thread_;

  mutable std::mutex sessions_mutex_;
  std::list<std::unique_ptr<Session>> sessions_;  // Guarded by sessions_mutex_

  // Wakes sleeping bootstrap/maintenance threads on stop()
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;

  PeerConfig make_peer_config() const;

  // Thread bodies
  void accept_loop();
  void bootstrap_loop();
  void maintenance_loop();

  // Maintenance
  void run_maintenance();
  void reap_sessions();

  // Session callbacks
  void on_peer_ready(const PeerPtr& peer);
  void on_peer_closed(const PeerPtr& peer, DisconnectReason reason);

  // Message handling
  void setup_message_handlers();
  bool handle_tx(PeerPtr peer, message::TxMessage& msg);
  bool handle_inv(PeerPtr peer, message::InvMessage& msg);
  bool handle_getdata(PeerPtr peer, message::GetDataMessage& msg);
  bool handle_getheaders(PeerPtr peer, message::LocatorMessage& msg);
  bool handle_getblocks(PeerPtr peer, message::LocatorMessage& msg);
  bool handle_headers(PeerPtr peer, message::HeadersMessage& msg);
  bool handle_block(PeerPtr peer, message::BlockMessage& msg);
  bool handle_mempool(PeerPtr peer);
  bool handle_reject(PeerPtr peer, message::RejectMessage& msg);
};

}  // namespace network
}  // namespace bitwire
