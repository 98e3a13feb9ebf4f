// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include "network/wire_codec.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace bitwire {
namespace network {

// Forward declarations
class Peer;
class MessageDispatcher;
using PeerPtr = std::shared_ptr<Peer>;

enum class PeerDirection { INBOUND, OUTBOUND };

// Peer session states
enum class PeerConnectionState {
  CONNECTING,   // Stream established, session not started
  HANDSHAKING,  // VERSION/VERACK exchange in progress
  READY,        // Handshake complete, steady-state receive loop
  CLOSED        // Terminal
};

// Why a session ended
enum class DisconnectReason {
  None,
  InvalidMagic,
  ChecksumMismatch,
  OversizedMessage,
  StreamClosed,
  IoError,
  InvalidHandshake,
  ProtocolViolation,
  MalformedMessage,
  HandshakeTimeout,
  InactivityTimeout,
  PingTimeout,
  ConnectionLimit,
  SendQueueOverflow,
  Shutdown,
  LocalRequest,
};

const char* PeerConnectionStateToString(PeerConnectionState state);
const char* DisconnectReasonToString(DisconnectReason reason);

// Peer connection statistics
struct PeerStats {
  std::atomic<uint64_t> bytes_sent{0};
  std::atomic<uint64_t> bytes_received{0};
  std::atomic<uint64_t> messages_sent{0};
  std::atomic<uint64_t> messages_received{0};
  std::atomic<int64_t> connected_time{0};  // unix seconds
  std::atomic<int64_t> last_send{0};       // unix seconds
  std::atomic<int64_t> last_recv{0};       // unix seconds
  std::atomic<std::chrono::milliseconds> ping_time_ms{std::chrono::milliseconds{-1}};  // -1 means not measured yet
};

// Local side of the handshake and session timeouts
struct PeerConfig {
  uint32_t network_magic{protocol::magic::MAINNET};
  int32_t protocol_version{protocol::PROTOCOL_VERSION};
  uint64_t local_services{protocol::NODE_NETWORK};
  int32_t start_height{0};
  std::string user_agent{protocol::GetUserAgent()};
  bool relay{true};
  size_t send_queue_limit{protocol::DEFAULT_SEND_QUEUE_SIZE};  // Bytes of unwritten frames before disconnect
  std::chrono::milliseconds handshake_timeout{std::chrono::seconds(protocol::VERSION_HANDSHAKE_TIMEOUT_SEC)};
  std::chrono::milliseconds inactivity_timeout{std::chrono::seconds(protocol::INACTIVITY_TIMEOUT_SEC)};
};

// Called once when the handshake completes
using ReadyHandler = std::function<void(PeerPtr peer)>;

// Called exactly once when the session reaches CLOSED
using ClosedHandler = std::function<void(PeerPtr peer, DisconnectReason reason)>;

// Peer class - One connection's session
//
// Owns its ByteStream and runs the whole session on the thread that calls
// run(): handshake (outbound sends VERSION first, inbound waits for the
// remote VERSION), then the READY receive loop, then close. Frames from one
// peer are therefore processed strictly in arrival order.
//
// Threading Model:
// - run() is called exactly once, on the session's own thread
// - run() starts a writer thread that owns all writes to the stream
// - send_message() may be called from any thread; it only appends the encoded
//   frame to send_queue_ and never waits on the socket, so relaying to a peer
//   that stopped reading cannot stall the caller. A queue above
//   send_queue_limit disconnects the peer with SendQueueOverflow.
// - disconnect() may be called from any thread; it interrupts the stream and
//   the session thread observes it within STREAM_POLL_INTERVAL_MS
// - Handshake results are atomics or guarded by info_mutex_ so other threads
//   can read them while the session runs
class Peer : public std::enable_shared_from_this<Peer> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  // Create outbound peer (we initiated the connection and send VERSION first)
  static PeerPtr create_outbound(ByteStreamPtr stream, const PeerConfig& config);

  // Create inbound peer (they connected to us)
  static PeerPtr create_inbound(ByteStreamPtr stream, const PeerConfig& config);

  ~Peer();

  Peer(const Peer&) = delete;
  Peer& operator=(const Peer&) = delete;

  // Run the session to completion on the calling thread. Returns the close reason.
  DisconnectReason run();

  // Request close from any thread. The first reason wins.
  void disconnect(DisconnectReason reason = DisconnectReason::LocalRequest);

  // Queue one frame for the writer thread. Thread-safe. False if closed or the send queue is full.
  bool send_message(const message::Message& msg);

  // Send a keepalive ping and remember its nonce. False if one is already outstanding.
  bool send_ping();

  void set_dispatcher(MessageDispatcher* dispatcher) { dispatcher_ = dispatcher; }
  void set_ready_handler(ReadyHandler handler) { ready_handler_ = std::move(handler); }
  void set_closed_handler(ClosedHandler handler) { closed_handler_ = std::move(handler); }

  // Setters (called by PeerLifecycleManager)
  void set_id(int id) { id_ = id; }
  // Process-wide VERSION nonce, set before run()
  void set_local_nonce(uint64_t nonce) { local_nonce_ = nonce; }

  // Getters
  int id() const { return id_; }
  PeerConnectionState state() const { return state_.load(std::memory_order_acquire); }
  bool is_ready() const { return state() == PeerConnectionState::READY; }
  bool is_closed() const { return state() == PeerConnectionState::CLOSED; }
  DisconnectReason disconnect_reason() const { return close_reason_.load(std::memory_order_acquire); }

  PeerDirection direction() const { return direction_; }
  bool is_inbound() const { return direction_ == PeerDirection::INBOUND; }

  const std::string& address() const { return address_; }
  uint16_t port() const { return port_; }
  std::string endpoint_string() const { return address_ + ":" + std::to_string(port_); }

  const PeerStats& stats() const { return stats_; }
  uint64_t get_local_nonce() const { return local_nonce_; }

  // Peer information from VERSION (empty until received)
  std::optional<int32_t> negotiated_version() const;
  std::optional<uint64_t> peer_services() const;
  int32_t version() const { return peer_version_.load(std::memory_order_acquire); }
  int32_t start_height() const { return peer_start_height_.load(std::memory_order_acquire); }
  uint64_t peer_nonce() const { return peer_nonce_.load(std::memory_order_acquire); }
  // VERSION relay flag: false means no transaction announcements
  bool relay() const { return peer_relay_.load(std::memory_order_acquire); }
  std::string user_agent() const;

  // Steady-state announcements
  int64_t fee_filter() const { return fee_filter_.load(std::memory_order_relaxed); }
  bool prefers_headers() const { return prefers_headers_.load(std::memory_order_relaxed); }

  // Bytes queued and not yet written
  size_t send_queue_bytes() const;

  // Keepalive tracking
  bool ping_outstanding() const { return ping_nonce_.load(std::memory_order_acquire) != 0; }
  std::chrono::steady_clock::time_point ping_sent_time() const;
  std::chrono::steady_clock::time_point last_ping_time() const;

  // Public constructor for make_shared, but requires PrivateTag (passkey idiom)
  Peer(PrivateTag, ByteStreamPtr stream, const PeerConfig& config, PeerDirection direction);

private:
  // Handshake
  DisconnectReason do_handshake();
  bool send_version();
  DisconnectReason handle_version(const Frame& frame, bool& version_received);

  // Steady state
  DisconnectReason ready_loop();
  DisconnectReason process_ready_message(const Frame& frame);
  void handle_pong(const message::PongMessage& msg);

  // Map a non-Ok frame status to a close reason
  DisconnectReason reason_for(FrameStatus status, DisconnectReason timeout_reason) const;

  // Reason passed to disconnect(), or fallback if none was requested
  DisconnectReason requested_or(DisconnectReason fallback) const;

  // Transition to CLOSED, close the stream, notify once
  void finish(DisconnectReason reason);

  // Writer thread: drain send_queue_ in order until stopped or a write fails
  void writer_loop();
  void stop_writer();

  void note_received(const Frame& frame);
  void log_unknown_command(const std::string& command);

  ByteStreamPtr stream_;
  const PeerConfig config_;
  const PeerDirection direction_;
  int id_{-1};
  uint64_t local_nonce_;

  std::string address_;
  uint16_t port_{0};

  MessageDispatcher* dispatcher_{nullptr};
  ReadyHandler ready_handler_;
  ClosedHandler closed_handler_;

  std::atomic<PeerConnectionState> state_{PeerConnectionState::CONNECTING};
  std::atomic<DisconnectReason> requested_reason_{DisconnectReason::None};
  std::atomic<DisconnectReason> close_reason_{DisconnectReason::None};
  std::atomic<bool> started_{false};
  PeerStats stats_;

  mutable std::mutex send_mutex_;
  std::condition_variable send_cv_;
  std::deque<std::vector<uint8_t>> send_queue_;  // Guarded by send_mutex_
  size_t send_queue_bytes_{0};                    // Guarded by send_mutex_
  bool writer_stopping_{false};                   // Guarded by send_mutex_
  bool send_closed_{false};                       // Guarded by send_mutex_
  std::thread writer_thread_;
  bool stream_closed_{false};  // Session thread only

  // Peer info from VERSION
  std::atomic<bool> version_received_{false};
  std::atomic<int32_t> peer_version_{0};
  std::atomic<int32_t> negotiated_version_{0};
  std::atomic<uint64_t> peer_services_{0};
  std::atomic<int32_t> peer_start_height_{0};
  std::atomic<uint64_t> peer_nonce_{0};
  std::atomic<bool> peer_relay_{true};
  mutable std::mutex info_mutex_;
  std::string peer_user_agent_;  // Guarded by info_mutex_

  std::atomic<int64_t> fee_filter_{0};
  std::atomic<bool> prefers_headers_{false};

  // Ping tracking (0 = none outstanding)
  std::atomic<uint64_t> ping_nonce_{0};
  std::atomic<std::chrono::steady_clock::time_point> ping_sent_time_{};
  std::atomic<std::chrono::steady_clock::time_point> last_ping_time_{};
};

}  // namespace network
}  // namespace bitwire
