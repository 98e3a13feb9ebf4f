// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "network/network_manager.hpp"

#include "chain/block.hpp"
#include "chain/block_store_interface.hpp"
#include "chain/mempool_interface.hpp"
#include "network/message.hpp"
#include "network/message_dispatcher.hpp"
#include "network/peer_discovery_manager.hpp"
#include "network/real_transport.hpp"
#include "util/logging.hpp"
#include "util/uint.hpp"

#include <algorithm>
#include <random>
#include <utility>

namespace bitwire {
namespace network {

// Number of blocks announced per GETBLOCKS reply
static constexpr size_t MAX_BLOCKS_PER_GETBLOCKS = 500;

// Accept wait slice; stop_listening() wakes it earlier
static constexpr std::chrono::seconds ACCEPT_WAIT{1};

// Helper to generate random nonce (called once at startup)
static uint64_t generate_nonce(const NetworkManager::Config& config) {
  // Test override for determinism
  if (config.test_nonce) {
    return *config.test_nonce;
  }

  std::random_device rd;
  std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) | rd());
  std::uniform_int_distribution<uint64_t> dis;
  return dis(gen);
}

NetworkManager::NetworkManager(chain::MempoolInterface& mempool, chain::BlockStoreInterface& block_store,
                               const Config& config, std::shared_ptr<Transport> transport)
    : config_(config), local_nonce_(generate_nonce(config)),
      transport_(transport ? std::move(transport) : std::make_shared<RealTransport>()), mempool_(mempool),
      block_store_(block_store) {
  PeerLifecycleManager::Config peer_config;
  peer_config.max_inbound_peers = config_.max_inbound_connections;
  peer_config.max_outbound_peers = config_.max_outbound_connections;

  peer_manager_ = std::make_unique<PeerLifecycleManager>(peer_config);
  discovery_manager_ = std::make_unique<PeerDiscoveryManager>();
  message_dispatcher_ = std::make_unique<MessageDispatcher>();

  setup_message_handlers();
}

NetworkManager::~NetworkManager() {
  stop();
}

bool NetworkManager::start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  if (config_.listen_enabled) {
    if (!transport_->listen(config_.listen_port)) {
      // Fail fast if we can't bind to the configured port
      LOG_NET_ERROR("Failed to start listener on port {}", config_.listen_port);
      return false;
    }
    listening_ = true;
    LOG_NET_INFO("Listening for inbound connections on port {}", transport_->listening_port());
  }

  running_.store(true, std::memory_order_release);

  if (listening_) {
    accept_thread_ = std::thread([this]() { accept_loop(); });
  }
  if (!config_.seeds.empty()) {
    bootstrap_thread_ = std::thread([this]() { bootstrap_loop(); });
  }
  maintenance_thread_ = std::thread([this]() { maintenance_loop(); });

  LOG_NET_INFO("NetworkManager started (magic={:#010x}, max_inbound={}, max_outbound={})", config_.network_magic,
               config_.max_inbound_connections, config_.max_outbound_connections);
  return true;
}

void NetworkManager::stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.load(std::memory_order_acquire) && !accept_thread_.joinable() && !maintenance_thread_.joinable() &&
      !bootstrap_thread_.joinable() && session_thread_count() == 0) {
    return;
  }

  // Set running_ = false FIRST so no new session is started
  {
    std::lock_guard<std::mutex> wake_lock(wake_mutex_);
    running_.store(false, std::memory_order_release);
  }
  wake_cv_.notify_all();

  // 1. Stop accepting
  if (listening_) {
    transport_->stop_listening();
  }

  // 2. Interrupt every session (registered or not yet running)
  peer_manager_->disconnect_all(DisconnectReason::Shutdown);
  {
    std::lock_guard<std::mutex> sessions_lock(sessions_mutex_);
    for (auto& session : sessions_) {
      session->peer->disconnect(DisconnectReason::Shutdown);
    }
  }

  // 3. Join service threads
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (bootstrap_thread_.joinable()) {
    bootstrap_thread_.join();
  }
  if (maintenance_thread_.joinable()) {
    maintenance_thread_.join();
  }

  // 4. Join sessions (none can be added once running_ is false)
  std::list<std::unique_ptr<Session>> sessions;
  {
    std::lock_guard<std::mutex> sessions_lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto& session : sessions) {
    if (session->thread.joinable()) {
      session->thread.join();
    }
  }
  listening_ = false;

  LOG_NET_INFO("NetworkManager stopped ({} sessions joined)", sessions.size());
}

PeerConfig NetworkManager::make_peer_config() const {
  PeerConfig peer_config;
  peer_config.network_magic = config_.network_magic;
  peer_config.protocol_version = config_.protocol_version;
  peer_config.local_services = config_.local_services;
  peer_config.start_height = block_store_.chain_tip().height;
  peer_config.user_agent = config_.user_agent;
  peer_config.handshake_timeout = config_.handshake_timeout;
  peer_config.inactivity_timeout = config_.inactivity_timeout;
  return peer_config;
}

ConnectionResult NetworkManager::connect_to(const std::string& address, uint16_t port) {
  if (!is_running()) {
    return ConnectionResult::NotRunning;
  }
  if (!peer_manager_->needs_more_outbound()) {
    return ConnectionResult::NoSlotsAvailable;
  }

  LOG_NET_DEBUG("Connecting to {}:{}", address, port);
  ByteStreamPtr stream = transport_->connect(address, port, config_.connect_timeout);
  if (!stream) {
    LOG_NET_DEBUG("Connection to {}:{} failed", address, port);
    return ConnectionResult::TransportFailed;
  }

  if (!add_connection(std::move(stream), PeerDirection::OUTBOUND)) {
    return is_running() ? ConnectionResult::NoSlotsAvailable : ConnectionResult::NotRunning;
  }
  return ConnectionResult::Success;
}

PeerPtr NetworkManager::add_connection(ByteStreamPtr stream, PeerDirection direction) {
  if (!stream) {
    return nullptr;
  }
  if (!is_running()) {
    stream->close();
    return nullptr;
  }

  const PeerConfig peer_config = make_peer_config();
  PeerPtr peer = direction == PeerDirection::INBOUND ? Peer::create_inbound(std::move(stream), peer_config)
                                                     : Peer::create_outbound(std::move(stream), peer_config);
  peer->set_local_nonce(local_nonce_);

  // Beyond the limit: the peer is dropped here and its destructor closes the stream
  const int peer_id = peer_manager_->add_peer(peer);
  if (peer_id < 0) {
    LOG_NET_INFO("Closing {} connection {}: {}", direction == PeerDirection::INBOUND ? "inbound" : "outbound",
                 peer->endpoint_string(), DisconnectReasonToString(DisconnectReason::ConnectionLimit));
    return nullptr;
  }

  peer->set_dispatcher(message_dispatcher_.get());
  peer->set_ready_handler([this](PeerPtr p) { on_peer_ready(p); });
  peer->set_closed_handler([this](PeerPtr p, DisconnectReason reason) { on_peer_closed(p, reason); });

  std::lock_guard<std::mutex> lock(sessions_mutex_);
  if (!is_running()) {
    peer_manager_->remove_peer(peer_id);
    return nullptr;
  }
  auto session = std::make_unique<Session>();
  session->peer = peer;
  Session* raw = session.get();
  session->thread = std::thread([raw]() {
    raw->peer->run();
    raw->done.store(true, std::memory_order_release);
  });
  sessions_.push_back(std::move(session));
  return peer;
}

bool NetworkManager::disconnect_from(int peer_id) {
  PeerPtr peer = peer_manager_->get_peer(peer_id);
  if (!peer) {
    return false;
  }
  peer->disconnect(DisconnectReason::LocalRequest);
  return true;
}

size_t NetworkManager::broadcast(const message::Message& msg, int exclude_peer_id) {
  size_t sent = 0;
  for (const auto& peer : peer_manager_->get_ready_peers()) {
    if (peer->id() == exclude_peer_id) {
      continue;
    }
    if (peer->send_message(msg)) {
      sent++;
    }
  }
  return sent;
}

size_t NetworkManager::relay_transaction(const uint256& txid, int exclude_peer_id) {
  message::InvMessage inv;
  inv.inventory.emplace_back(protocol::InventoryType::MSG_TX, txid);

  size_t sent = 0;
  for (const auto& peer : peer_manager_->get_ready_peers()) {
    // Peers that sent relay=0 in VERSION get no transaction announcements
    if (peer->id() == exclude_peer_id || !peer->relay()) {
      continue;
    }
    if (peer->send_message(inv)) {
      sent++;
    }
  }
  LOG_NET_DEBUG("Relayed tx {} to {} peers", txid.GetHex(), sent);
  return sent;
}

size_t NetworkManager::relay_block(const CBlockHeader& header, int exclude_peer_id) {
  message::InvMessage inv;
  inv.inventory.emplace_back(protocol::InventoryType::MSG_BLOCK, header.GetHash());
  message::HeadersMessage headers;
  headers.headers.push_back(header);

  size_t sent = 0;
  for (const auto& peer : peer_manager_->get_ready_peers()) {
    if (peer->id() == exclude_peer_id) {
      continue;
    }
    bool ok = peer->prefers_headers() ? peer->send_message(headers) : peer->send_message(inv);
    if (ok) {
      sent++;
    }
  }
  return sent;
}

uint16_t NetworkManager::listening_port() const {
  return transport_->listening_port();
}

size_t NetworkManager::active_peer_count() const {
  return peer_manager_->peer_count();
}

size_t NetworkManager::outbound_peer_count() const {
  return peer_manager_->outbound_count();
}

size_t NetworkManager::inbound_peer_count() const {
  return peer_manager_->inbound_count();
}

size_t NetworkManager::session_thread_count() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

// === Thread bodies ===

void NetworkManager::accept_loop() {
  while (is_running()) {
    ByteStreamPtr stream;
    StreamStatus status = transport_->accept(stream, ByteStream::Clock::now() + ACCEPT_WAIT);
    switch (status) {
    case StreamStatus::Ok:
      LOG_NET_DEBUG("Accepted inbound connection from {}:{}", stream->remote_address(), stream->remote_port());
      add_connection(std::move(stream), PeerDirection::INBOUND);
      break;
    case StreamStatus::Timeout:
      break;
    case StreamStatus::Interrupted:
      return;
    case StreamStatus::Closed:
    case StreamStatus::Error: {
      LOG_NET_WARN_RL("accept failed: {}", StreamStatusToString(status));
      // Avoid spinning on a persistent accept error
      std::unique_lock<std::mutex> lock(wake_mutex_);
      wake_cv_.wait_for(lock, std::chrono::milliseconds(protocol::STREAM_POLL_INTERVAL_MS),
                        [this]() { return !is_running(); });
      break;
    }
    }
  }
}

void NetworkManager::bootstrap_loop() {
  for (const auto& seed : config_.seeds) {
    if (!is_running()) {
      return;
    }

    std::vector<SeedAddress> endpoints = PeerDiscoveryManager::ResolveSeed(seed, config_.default_port);
    LOG_NET_INFO("Seed {} yielded {} addresses", seed, endpoints.size());

    for (const auto& endpoint : endpoints) {
      if (!is_running()) {
        return;
      }
      if (!peer_manager_->needs_more_outbound()) {
        LOG_NET_INFO("Outbound limit ({}) reached, bootstrap done", config_.max_outbound_connections);
        return;
      }
      ConnectionResult result = connect_to(endpoint.address, endpoint.port);
      if (result == ConnectionResult::TransportFailed) {
        LOG_NET_WARN("Could not connect to seed address {}:{}", endpoint.address, endpoint.port);
      }
    }
  }
  LOG_NET_DEBUG("Bootstrap finished: {} outbound peers", peer_manager_->outbound_count());
}

void NetworkManager::maintenance_loop() {
  std::unique_lock<std::mutex> lock(wake_mutex_);
  while (is_running()) {
    wake_cv_.wait_for(lock, config_.maintenance_interval, [this]() { return !is_running(); });
    if (!is_running()) {
      break;
    }
    lock.unlock();
    run_maintenance();
    lock.lock();
  }
}

void NetworkManager::run_maintenance() {
  const auto now = std::chrono::steady_clock::now();

  for (const auto& peer : peer_manager_->get_ready_peers()) {
    if (peer->ping_outstanding()) {
      if (now - peer->ping_sent_time() > config_.ping_timeout) {
        LOG_NET_INFO("Ping timeout: peer={} {}", peer->id(), peer->endpoint_string());
        peer->disconnect(DisconnectReason::PingTimeout);
      }
      continue;
    }
    if (now - peer->last_ping_time() >= config_.ping_interval) {
      peer->send_ping();
    }
  }

  reap_sessions();
}

void NetworkManager::reap_sessions() {
  std::list<std::unique_ptr<Session>> finished;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if ((*it)->done.load(std::memory_order_acquire)) {
        finished.push_back(std::move(*it));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& session : finished) {
    session->thread.join();
  }
  if (!finished.empty()) {
    LOG_NET_TRACE("Reaped {} finished session threads", finished.size());
  }
}

// === Session callbacks ===

void NetworkManager::on_peer_ready(const PeerPtr& peer) {
  LOG_NET_INFO("New {} peer connected: peer={} {} version={} ({} peers)", peer->is_inbound() ? "inbound" : "outbound",
               peer->id(), peer->endpoint_string(), peer->negotiated_version().value_or(0),
               peer_manager_->peer_count());
}

void NetworkManager::on_peer_closed(const PeerPtr& peer, DisconnectReason reason) {
  peer_manager_->remove_peer(peer->id());
  discovery_manager_->OnPeerDisconnected(peer->id());
  LOG_NET_DEBUG("Session peer={} closed ({}), {} peers remain", peer->id(), DisconnectReasonToString(reason),
                peer_manager_->peer_count());
}

// === Message handling ===

void NetworkManager::setup_message_handlers() {
  auto& d = *message_dispatcher_;

  d.RegisterHandler(protocol::commands::TX, [this](PeerPtr peer, message::Message* msg) {
    return handle_tx(peer, static_cast<message::TxMessage&>(*msg));
  });
  d.RegisterHandler(protocol::commands::INV, [this](PeerPtr peer, message::Message* msg) {
    return handle_inv(peer, static_cast<message::InvMessage&>(*msg));
  });
  d.RegisterHandler(protocol::commands::GETDATA, [this](PeerPtr peer, message::Message* msg) {
    return handle_getdata(peer, static_cast<message::GetDataMessage&>(*msg));
  });
  d.RegisterHandler(protocol::commands::GETHEADERS, [this](PeerPtr peer, message::Message* msg) {
    return handle_getheaders(peer, static_cast<message::LocatorMessage&>(*msg));
  });
  d.RegisterHandler(protocol::commands::GETBLOCKS, [this](PeerPtr peer, message::Message* msg) {
    return handle_getblocks(peer, static_cast<message::LocatorMessage&>(*msg));
  });
  d.RegisterHandler(protocol::commands::HEADERS, [this](PeerPtr peer, message::Message* msg) {
    return handle_headers(peer, static_cast<message::HeadersMessage&>(*msg));
  });
  d.RegisterHandler(protocol::commands::BLOCK, [this](PeerPtr peer, message::Message* msg) {
    return handle_block(peer, static_cast<message::BlockMessage&>(*msg));
  });
  d.RegisterHandler(protocol::commands::ADDR, [this](PeerPtr peer, message::Message* msg) {
    return discovery_manager_->HandleAddr(peer, static_cast<message::AddrMessage*>(msg));
  });
  d.RegisterHandler(protocol::commands::GETADDR,
                    [this](PeerPtr peer, message::Message*) { return discovery_manager_->HandleGetAddr(peer); });
  d.RegisterHandler(protocol::commands::MEMPOOL,
                    [this](PeerPtr peer, message::Message*) { return handle_mempool(peer); });
  d.RegisterHandler(protocol::commands::NOTFOUND, [](PeerPtr peer, message::Message* msg) {
    LOG_NET_DEBUG("peer={} reported {} items not found", peer->id(),
                  static_cast<message::NotFoundMessage*>(msg)->inventory.size());
    return true;
  });
  d.RegisterHandler(protocol::commands::REJECT, [this](PeerPtr peer, message::Message* msg) {
    return handle_reject(peer, static_cast<message::RejectMessage&>(*msg));
  });
}

bool NetworkManager::handle_tx(PeerPtr peer, message::TxMessage& msg) {
  const uint256 txid = msg.txid();
  chain::MempoolAcceptResult result = mempool_.submit_transaction(msg.raw_tx);
  LOG_NET_DEBUG("tx {} from peer={}: {}", txid.GetHex(), peer->id(), chain::MempoolAcceptResultToString(result));

  switch (result) {
  case chain::MempoolAcceptResult::ACCEPTED:
    relay_transaction(txid, peer->id());
    break;
  case chain::MempoolAcceptResult::ALREADY_KNOWN:
    break;
  case chain::MempoolAcceptResult::REJECTED: {
    message::RejectMessage reject;
    reject.message = protocol::commands::TX;
    reject.ccode = message::RejectMessage::REJECT_INVALID;
    reject.reason = "mempool-rejected";
    reject.data.assign(txid.begin(), txid.end());
    peer->send_message(reject);
    break;
  }
  }
  return true;
}

bool NetworkManager::handle_inv(PeerPtr peer, message::InvMessage& msg) {
  message::GetDataMessage request;
  for (const auto& item : msg.inventory) {
    if (item.is_tx()) {
      if (!mempool_.contains(item.hash)) {
        request.inventory.push_back(item);
      }
    } else if (item.is_block()) {
      if (!block_store_.has_block(item.hash)) {
        request.inventory.push_back(item);
      }
    }
  }

  LOG_NET_TRACE("inv from peer={}: {} items, requesting {}", peer->id(), msg.inventory.size(),
                request.inventory.size());
  if (!request.inventory.empty()) {
    peer->send_message(request);
  }
  return true;
}

bool NetworkManager::handle_getdata(PeerPtr peer, message::GetDataMessage& msg) {
  message::NotFoundMessage not_found;

  for (const auto& item : msg.inventory) {
    if (item.is_tx()) {
      auto raw = mempool_.get_transaction(item.hash);
      if (!raw) {
        not_found.inventory.push_back(item);
        continue;
      }
      if (!peer->send_message(message::TxMessage(std::move(*raw)))) {
        return true;  // Session is closing
      }
    } else if (item.is_block()) {
      auto raw = block_store_.get_block(item.hash);
      message::BlockMessage block;
      if (!raw || !block.deserialize(raw->data(), raw->size())) {
        not_found.inventory.push_back(item);
        continue;
      }
      if (!peer->send_message(block)) {
        return true;
      }
    } else {
      not_found.inventory.push_back(item);
    }
  }

  if (!not_found.inventory.empty()) {
    peer->send_message(not_found);
  }
  return true;
}

bool NetworkManager::handle_getheaders(PeerPtr peer, message::LocatorMessage& msg) {
  message::HeadersMessage response;
  response.headers = block_store_.get_headers(msg.block_locator_hashes, msg.hash_stop, protocol::MAX_HEADERS_SIZE);
  LOG_NET_DEBUG("getheaders from peer={}: sending {} headers", peer->id(), response.headers.size());
  peer->send_message(response);
  return true;
}

bool NetworkManager::handle_getblocks(PeerPtr peer, message::LocatorMessage& msg) {
  auto headers = block_store_.get_headers(msg.block_locator_hashes, msg.hash_stop, MAX_BLOCKS_PER_GETBLOCKS);

  message::InvMessage response;
  for (const auto& header : headers) {
    uint256 hash = header.GetHash();
    if (block_store_.has_block(hash)) {
      response.inventory.emplace_back(protocol::InventoryType::MSG_BLOCK, hash);
    }
  }
  if (!response.inventory.empty()) {
    peer->send_message(response);
  }
  return true;
}

bool NetworkManager::handle_headers(PeerPtr peer, message::HeadersMessage& msg) {
  if (msg.headers.empty()) {
    return true;
  }
  size_t connected = block_store_.accept_headers(msg.headers);
  LOG_CHAIN_DEBUG("headers from peer={}: {} received, {} connected, tip height {}", peer->id(), msg.headers.size(),
                  connected, block_store_.chain_tip().height);
  return true;
}

bool NetworkManager::handle_block(PeerPtr peer, message::BlockMessage& msg) {
  const uint256 hash = msg.hash();
  if (!block_store_.accept_block(hash, msg.serialize())) {
    // Duplicates and blocks that do not connect are dropped without relay
    LOG_CHAIN_DEBUG("block {} from peer={} not stored", hash.GetHex(), peer->id());
    return true;
  }
  LOG_CHAIN_INFO("accepted block {} from peer={}", hash.GetHex(), peer->id());
  relay_block(msg.header, peer->id());
  return true;
}

bool NetworkManager::handle_mempool(PeerPtr peer) {
  message::InvMessage response;
  for (const auto& txid : mempool_.get_txids()) {
    if (response.inventory.size() >= protocol::MAX_INV_SIZE) {
      break;
    }
    response.inventory.emplace_back(protocol::InventoryType::MSG_TX, txid);
  }
  if (!response.inventory.empty()) {
    peer->send_message(response);
  }
  return true;
}

bool NetworkManager::handle_reject(PeerPtr peer, message::RejectMessage& msg) {
  std::string reason = msg.reason;
  reason.erase(std::remove_if(reason.begin(), reason.end(), [](unsigned char c) { return c < 32; }), reason.end());
  LOG_NET_WARN_RL("peer={} rejected {} (code {:#04x}): {}", peer->id(), msg.message.substr(0, 12), msg.ccode,
                  reason);
  return true;
}

}  // namespace network
}  // namespace bitwire
