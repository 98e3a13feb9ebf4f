// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "network/peer.hpp"

#include "network/message_dispatcher.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <random>

namespace bitwire {
namespace network {

// Random nonce for VERSION and ping messages (never 0, which marks "no ping outstanding")
static uint64_t generate_nonce() {
  static std::mutex mutex;
  static std::random_device rd;
  static std::mt19937_64 gen(rd());
  static std::uniform_int_distribution<uint64_t> dis(1);
  std::lock_guard<std::mutex> lock(mutex);
  return dis(gen);
}

// Peer-supplied strings go into log lines: cap length, drop control characters
static std::string sanitize_for_log(const std::string& input) {
  std::string out = input;
  if (out.size() > protocol::MAX_SUBVERSION_LENGTH) {
    out.resize(protocol::MAX_SUBVERSION_LENGTH);
    out += "...[truncated]";
  }
  out.erase(std::remove_if(out.begin(), out.end(), [](unsigned char c) { return c < 32 && c != '\t'; }),
            out.end());
  return out;
}

const char* PeerConnectionStateToString(PeerConnectionState state) {
  switch (state) {
  case PeerConnectionState::CONNECTING:
    return "connecting";
  case PeerConnectionState::HANDSHAKING:
    return "handshaking";
  case PeerConnectionState::READY:
    return "ready";
  case PeerConnectionState::CLOSED:
    return "closed";
  }
  return "unknown";
}

const char* DisconnectReasonToString(DisconnectReason reason) {
  switch (reason) {
  case DisconnectReason::None:
    return "none";
  case DisconnectReason::InvalidMagic:
    return "invalid magic";
  case DisconnectReason::ChecksumMismatch:
    return "checksum mismatch";
  case DisconnectReason::OversizedMessage:
    return "oversized message";
  case DisconnectReason::StreamClosed:
    return "stream closed";
  case DisconnectReason::IoError:
    return "i/o error";
  case DisconnectReason::InvalidHandshake:
    return "invalid handshake";
  case DisconnectReason::ProtocolViolation:
    return "protocol violation";
  case DisconnectReason::MalformedMessage:
    return "malformed message";
  case DisconnectReason::HandshakeTimeout:
    return "handshake timeout";
  case DisconnectReason::InactivityTimeout:
    return "inactivity timeout";
  case DisconnectReason::PingTimeout:
    return "ping timeout";
  case DisconnectReason::ConnectionLimit:
    return "connection limit";
  case DisconnectReason::SendQueueOverflow:
    return "send queue overflow";
  case DisconnectReason::Shutdown:
    return "shutdown";
  case DisconnectReason::LocalRequest:
    return "local request";
  }
  return "unknown";
}

Peer::Peer(PrivateTag, ByteStreamPtr stream, const PeerConfig& config, PeerDirection direction)
    : stream_(std::move(stream)), config_(config), direction_(direction), local_nonce_(generate_nonce()) {
  if (stream_) {
    address_ = stream_->remote_address();
    port_ = stream_->remote_port();
  }
}

PeerPtr Peer::create_outbound(ByteStreamPtr stream, const PeerConfig& config) {
  if (!stream) {
    return nullptr;
  }
  return std::make_shared<Peer>(PrivateTag{}, std::move(stream), config, PeerDirection::OUTBOUND);
}

PeerPtr Peer::create_inbound(ByteStreamPtr stream, const PeerConfig& config) {
  if (!stream) {
    return nullptr;
  }
  return std::make_shared<Peer>(PrivateTag{}, std::move(stream), config, PeerDirection::INBOUND);
}

Peer::~Peer() {
  stop_writer();
  // Sessions that never ran still own an open stream
  if (stream_ && !stream_closed_) {
    stream_->close();
  }
}

DisconnectReason Peer::run() {
  if (started_.exchange(true)) {
    LOG_NET_ERROR("peer={} run() called twice", id_);
    return close_reason_.load(std::memory_order_acquire);
  }

  stats_.connected_time.store(util::GetTime(), std::memory_order_relaxed);
  writer_thread_ = std::thread(&Peer::writer_loop, this);
  state_.store(PeerConnectionState::HANDSHAKING, std::memory_order_release);
  LOG_NET_DEBUG("peer={} {} {} starting handshake", id_, is_inbound() ? "inbound" : "outbound", endpoint_string());

  DisconnectReason reason = do_handshake();
  if (reason == DisconnectReason::None) {
    state_.store(PeerConnectionState::READY, std::memory_order_release);
    LOG_NET_INFO("handshake complete with peer={} {} version={} services={:#x} ua={}", id_, endpoint_string(),
                 negotiated_version_.load(), peer_services_.load(), sanitize_for_log(user_agent()));
    if (ready_handler_) {
      ready_handler_(shared_from_this());
    }
    reason = ready_loop();
  }

  finish(reason);
  return reason;
}

void Peer::disconnect(DisconnectReason reason) {
  DisconnectReason expected = DisconnectReason::None;
  requested_reason_.compare_exchange_strong(expected, reason, std::memory_order_acq_rel);
  if (stream_) {
    stream_->interrupt();
  }
}

bool Peer::send_message(const message::Message& msg) {
  if (!stream_ || is_closed()) {
    return false;
  }

  const std::string command = msg.command();
  std::vector<uint8_t> frame = encode_frame(config_.network_magic, command, msg.serialize());
  const size_t frame_size = frame.size();

  size_t queued = 0;
  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (send_closed_) {
      return false;
    }
    queued = send_queue_bytes_;
    if (queued + frame_size <= config_.send_queue_limit) {
      send_queue_bytes_ += frame_size;
      send_queue_.push_back(std::move(frame));
    }
  }

  if (queued + frame_size > config_.send_queue_limit) {
    LOG_NET_WARN_RL("send queue overflow for peer={} {} ({} bytes queued, {} incoming, limit {}), disconnecting",
                    id_, endpoint_string(), queued, frame_size, config_.send_queue_limit);
    disconnect(DisconnectReason::SendQueueOverflow);
    return false;
  }

  send_cv_.notify_all();
  LOG_NET_TRACE("queued {} ({} bytes) for peer={}", command, frame_size - protocol::MESSAGE_HEADER_SIZE, id_);
  return true;
}

size_t Peer::send_queue_bytes() const {
  std::lock_guard<std::mutex> lock(send_mutex_);
  return send_queue_bytes_;
}

void Peer::writer_loop() {
  for (;;) {
    std::vector<uint8_t> frame;
    {
      std::unique_lock<std::mutex> lock(send_mutex_);
      send_cv_.wait(lock, [this] { return writer_stopping_ || !send_queue_.empty(); });
      if (send_queue_.empty()) {
        return;
      }
      frame = std::move(send_queue_.front());
      send_queue_.pop_front();
    }

    const StreamStatus status = stream_->write_all(frame.data(), frame.size());

    if (status != StreamStatus::Ok) {
      {
        std::lock_guard<std::mutex> lock(send_mutex_);
        send_closed_ = true;
        send_queue_.clear();
        send_queue_bytes_ = 0;
      }
      send_cv_.notify_all();
      LOG_NET_DEBUG("write to peer={} failed: {}", id_, StreamStatusToString(status));
      disconnect(DisconnectReason::IoError);
      return;
    }

    {
      std::lock_guard<std::mutex> lock(send_mutex_);
      send_queue_bytes_ -= frame.size();
    }
    send_cv_.notify_all();
    stats_.bytes_sent.fetch_add(frame.size(), std::memory_order_relaxed);
    stats_.messages_sent.fetch_add(1, std::memory_order_relaxed);
    stats_.last_send.store(util::GetTime(), std::memory_order_relaxed);
  }
}

void Peer::stop_writer() {
  if (!writer_thread_.joinable()) {
    return;
  }
  {
    std::unique_lock<std::mutex> lock(send_mutex_);
    send_closed_ = true;
    writer_stopping_ = true;
    send_cv_.notify_all();
    // Frames queued before the close still go out unless the peer stopped reading
    send_cv_.wait_for(lock, std::chrono::milliseconds(protocol::SEND_FLUSH_TIMEOUT_MS),
                      [this] { return send_queue_bytes_ == 0; });
  }
  stream_->interrupt();
  writer_thread_.join();
}

bool Peer::send_ping() {
  if (!is_ready()) {
    return false;
  }
  const uint64_t nonce = generate_nonce();
  uint64_t expected = 0;
  if (!ping_nonce_.compare_exchange_strong(expected, nonce, std::memory_order_acq_rel)) {
    return false;
  }
  const auto now = std::chrono::steady_clock::now();
  ping_sent_time_.store(now, std::memory_order_release);
  last_ping_time_.store(now, std::memory_order_release);

  if (!send_message(message::PingMessage(nonce))) {
    ping_nonce_.store(0, std::memory_order_release);
    return false;
  }
  return true;
}

std::optional<int32_t> Peer::negotiated_version() const {
  if (!version_received_.load(std::memory_order_acquire)) {
    return std::nullopt;
  }
  return negotiated_version_.load(std::memory_order_acquire);
}

std::optional<uint64_t> Peer::peer_services() const {
  if (!version_received_.load(std::memory_order_acquire)) {
    return std::nullopt;
  }
  return peer_services_.load(std::memory_order_acquire);
}

std::string Peer::user_agent() const {
  std::lock_guard<std::mutex> lock(info_mutex_);
  return peer_user_agent_;
}

std::chrono::steady_clock::time_point Peer::ping_sent_time() const {
  return ping_sent_time_.load(std::memory_order_acquire);
}

std::chrono::steady_clock::time_point Peer::last_ping_time() const {
  return last_ping_time_.load(std::memory_order_acquire);
}

// === Handshake ===

DisconnectReason Peer::do_handshake() {
  const auto deadline = ByteStream::Clock::now() + config_.handshake_timeout;

  if (direction_ == PeerDirection::OUTBOUND && !send_version()) {
    return requested_or(DisconnectReason::IoError);
  }

  bool version_received = false;
  for (;;) {
    Frame frame;
    FrameStatus status = read_frame(*stream_, config_.network_magic, deadline, frame);
    if (status != FrameStatus::Ok) {
      return reason_for(status, DisconnectReason::HandshakeTimeout);
    }
    note_received(frame);

    if (frame.command == protocol::commands::VERSION) {
      DisconnectReason reason = handle_version(frame, version_received);
      if (reason != DisconnectReason::None) {
        return reason;
      }
      continue;
    }

    if (frame.command == protocol::commands::VERACK) {
      if (!version_received) {
        LOG_NET_WARN_RL("peer={} {} sent verack before version", id_, endpoint_string());
        return DisconnectReason::InvalidHandshake;
      }
      if (!frame.payload.empty()) {
        LOG_NET_WARN_RL("peer={} sent verack with {} byte payload", id_, frame.payload.size());
        return DisconnectReason::MalformedMessage;
      }
      return DisconnectReason::None;
    }

    if (!protocol::IsKnownCommand(frame.command)) {
      log_unknown_command(frame.command);
      continue;
    }

    LOG_NET_WARN_RL("peer={} {} sent {} before handshake completed", id_, endpoint_string(),
                    sanitize_for_log(frame.command));
    return DisconnectReason::InvalidHandshake;
  }
}

bool Peer::send_version() {
  message::VersionMessage version;
  version.version = config_.protocol_version;
  version.services = config_.local_services;
  version.timestamp = util::GetTime();
  // addr_recv: the address we see the peer at (services unknown before its VERSION)
  version.addr_recv = protocol::NetworkAddress::from_string(address_, port_, 0);
  // addr_from: left empty, as Bitcoin Core does
  version.addr_from = protocol::NetworkAddress{};
  version.nonce = local_nonce_;
  version.user_agent = config_.user_agent;
  version.start_height = config_.start_height;
  version.relay = config_.relay;

  LOG_NET_DEBUG("send version message: version {}, blocks={}, peer={}", version.version, version.start_height,
                id_);
  return send_message(version);
}

DisconnectReason Peer::handle_version(const Frame& frame, bool& version_received) {
  if (version_received) {
    LOG_NET_WARN_RL("peer={} {} sent duplicate version", id_, endpoint_string());
    return DisconnectReason::InvalidHandshake;
  }

  message::VersionMessage msg;
  if (!msg.deserialize(frame.payload.data(), frame.payload.size())) {
    LOG_NET_WARN_RL("peer={} {} sent malformed version ({} bytes)", id_, endpoint_string(), frame.payload.size());
    return DisconnectReason::MalformedMessage;
  }

  version_received = true;
  peer_version_.store(msg.version, std::memory_order_release);
  negotiated_version_.store(std::min(config_.protocol_version, msg.version), std::memory_order_release);
  peer_services_.store(msg.services, std::memory_order_release);
  peer_start_height_.store(msg.start_height, std::memory_order_release);
  peer_nonce_.store(msg.nonce, std::memory_order_release);
  peer_relay_.store(msg.relay, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(info_mutex_);
    peer_user_agent_ = msg.user_agent;
  }
  version_received_.store(true, std::memory_order_release);

  LOG_NET_DEBUG("receive version message: {}: version {}, blocks={}, peer={}", sanitize_for_log(msg.user_agent),
                msg.version, msg.start_height, id_);

  // Inbound answers with its own VERSION before acknowledging
  if (direction_ == PeerDirection::INBOUND && !send_version()) {
    return requested_or(DisconnectReason::IoError);
  }
  if (!send_message(message::VerackMessage())) {
    return requested_or(DisconnectReason::IoError);
  }
  return DisconnectReason::None;
}

// === Steady state ===

DisconnectReason Peer::ready_loop() {
  for (;;) {
    Frame frame;
    const auto deadline = ByteStream::Clock::now() + config_.inactivity_timeout;
    FrameStatus status = read_frame(*stream_, config_.network_magic, deadline, frame);
    if (status != FrameStatus::Ok) {
      return reason_for(status, DisconnectReason::InactivityTimeout);
    }
    note_received(frame);

    DisconnectReason reason = process_ready_message(frame);
    if (reason != DisconnectReason::None) {
      return reason;
    }
  }
}

DisconnectReason Peer::process_ready_message(const Frame& frame) {
  const std::string& command = frame.command;

  if (command == protocol::commands::VERSION || command == protocol::commands::VERACK) {
    LOG_NET_WARN_RL("peer={} {} sent {} after handshake", id_, endpoint_string(), command);
    return DisconnectReason::ProtocolViolation;
  }

  std::unique_ptr<message::Message> msg = message::create_message(command);
  if (!msg) {
    log_unknown_command(command);
    return DisconnectReason::None;
  }

  if (!msg->deserialize(frame.payload.data(), frame.payload.size())) {
    LOG_NET_WARN_RL("peer={} {} sent malformed {} ({} bytes)", id_, endpoint_string(), command,
                    frame.payload.size());
    return DisconnectReason::MalformedMessage;
  }

  if (command == protocol::commands::PING) {
    auto& ping = static_cast<message::PingMessage&>(*msg);
    if (!send_message(message::PongMessage(ping.nonce))) {
      return requested_or(DisconnectReason::IoError);
    }
    return DisconnectReason::None;
  }

  if (command == protocol::commands::PONG) {
    handle_pong(static_cast<message::PongMessage&>(*msg));
    return DisconnectReason::None;
  }

  if (command == protocol::commands::FEEFILTER) {
    fee_filter_.store(static_cast<message::FeeFilterMessage&>(*msg).feerate, std::memory_order_relaxed);
    LOG_NET_DEBUG("peer={} set fee filter to {} sat/kvB", id_, fee_filter_.load());
    return DisconnectReason::None;
  }

  if (command == protocol::commands::SENDHEADERS) {
    prefers_headers_.store(true, std::memory_order_relaxed);
    return DisconnectReason::None;
  }

  if (command == protocol::commands::SENDCMPCT) {
    // Compact blocks are not served; the announcement is only validated
    auto& cmpct = static_cast<message::SendCmpctMessage&>(*msg);
    LOG_NET_DEBUG("peer={} sendcmpct announce={} version={} ignored", id_, cmpct.announce, cmpct.version);
    return DisconnectReason::None;
  }

  if (!dispatcher_) {
    LOG_NET_DEBUG("no dispatcher, dropping {} from peer={}", command, id_);
    return DisconnectReason::None;
  }

  switch (dispatcher_->Dispatch(shared_from_this(), command, msg.get())) {
  case MessageDispatcher::Result::HANDLED:
    break;
  case MessageDispatcher::Result::NO_HANDLER:
    LOG_NET_DEBUG("no handler for {} from peer={}", command, id_);
    break;
  case MessageDispatcher::Result::REJECTED:
    LOG_NET_WARN_RL("handler rejected {} from peer={} {}", command, id_, endpoint_string());
    return DisconnectReason::ProtocolViolation;
  }
  return DisconnectReason::None;
}

void Peer::handle_pong(const message::PongMessage& msg) {
  uint64_t expected = ping_nonce_.load(std::memory_order_acquire);
  if (expected == 0 || msg.nonce != expected) {
    LOG_NET_DEBUG("peer={} unsolicited pong nonce={:#x}", id_, msg.nonce);
    return;
  }
  if (!ping_nonce_.compare_exchange_strong(expected, 0, std::memory_order_acq_rel)) {
    return;
  }
  auto rtt = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                    ping_sent_time());
  stats_.ping_time_ms.store(rtt, std::memory_order_relaxed);
  LOG_NET_TRACE("peer={} ping time {}ms", id_, rtt.count());
}

// === Teardown and helpers ===

DisconnectReason Peer::reason_for(FrameStatus status, DisconnectReason timeout_reason) const {
  switch (status) {
  case FrameStatus::Ok:
    return DisconnectReason::None;
  case FrameStatus::InvalidMagic:
    return DisconnectReason::InvalidMagic;
  case FrameStatus::ChecksumMismatch:
    return DisconnectReason::ChecksumMismatch;
  case FrameStatus::OversizedPayload:
    return DisconnectReason::OversizedMessage;
  case FrameStatus::Truncated:
    return requested_or(DisconnectReason::StreamClosed);
  case FrameStatus::Timeout:
    return timeout_reason;
  case FrameStatus::Interrupted:
    return requested_or(DisconnectReason::Shutdown);
  case FrameStatus::IoError:
    return requested_or(DisconnectReason::IoError);
  }
  return DisconnectReason::IoError;
}

DisconnectReason Peer::requested_or(DisconnectReason fallback) const {
  DisconnectReason requested = requested_reason_.load(std::memory_order_acquire);
  return requested == DisconnectReason::None ? fallback : requested;
}

void Peer::finish(DisconnectReason reason) {
  close_reason_.store(reason, std::memory_order_release);

  stop_writer();
  stream_->interrupt();
  if (!stream_closed_) {
    stream_->close();
    stream_closed_ = true;
  }
  state_.store(PeerConnectionState::CLOSED, std::memory_order_release);

  if (reason == DisconnectReason::Shutdown || reason == DisconnectReason::LocalRequest) {
    LOG_NET_DEBUG("disconnected peer={} {}: {}", id_, endpoint_string(), DisconnectReasonToString(reason));
  } else {
    LOG_NET_INFO("disconnected peer={} {}: {}", id_, endpoint_string(), DisconnectReasonToString(reason));
  }

  if (closed_handler_) {
    closed_handler_(shared_from_this(), reason);
  }
}

void Peer::note_received(const Frame& frame) {
  stats_.bytes_received.fetch_add(protocol::MESSAGE_HEADER_SIZE + frame.payload.size(), std::memory_order_relaxed);
  stats_.messages_received.fetch_add(1, std::memory_order_relaxed);
  stats_.last_recv.store(util::GetTime(), std::memory_order_relaxed);
  LOG_NET_TRACE("received {} ({} bytes) from peer={}", sanitize_for_log(frame.command), frame.payload.size(), id_);
}

void Peer::log_unknown_command(const std::string& command) {
  LOG_NET_WARN_RL("ignoring unknown command '{}' from peer={}", sanitize_for_log(command), id_);
}

}  // namespace network
}  // namespace bitwire
