// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "network/peer_lifecycle_manager.hpp"

#include "util/logging.hpp"

namespace bitwire {
namespace network {

PeerLifecycleManager::PeerLifecycleManager(const Config& config) : config_(config) {}

PeerLifecycleManager::~PeerLifecycleManager() {
  disconnect_all();
}

int PeerLifecycleManager::add_peer(PeerPtr peer) {
  if (!peer) {
    return -1;
  }

  std::lock_guard<std::mutex> lock(add_mutex_);

  if (stopping_all_.load(std::memory_order_acquire)) {
    LOG_NET_TRACE("add_peer: rejected while disconnect_all in progress");
    return -1;
  }

  // Count current connections in single pass
  size_t current_inbound = 0;
  size_t current_outbound = 0;
  peer_states_.ForEach([&](int /*id*/, const PeerTrackingData& state) {
    if (state.is_inbound()) {
      current_inbound++;
    } else {
      current_outbound++;
    }
  });

  if (peer->is_inbound() && current_inbound >= config_.max_inbound_peers) {
    LOG_NET_INFO("rejecting inbound {}: inbound limit reached ({}/{})", peer->endpoint_string(), current_inbound,
                 config_.max_inbound_peers);
    return -1;
  }
  if (!peer->is_inbound() && current_outbound >= config_.max_outbound_peers) {
    LOG_NET_INFO("rejecting outbound {}: outbound limit reached ({}/{})", peer->endpoint_string(), current_outbound,
                 config_.max_outbound_peers);
    return -1;
  }

  int peer_id = next_peer_id_.fetch_add(1, std::memory_order_relaxed);
  peer->set_id(peer_id);
  peer_states_.Insert(peer_id, PeerTrackingData(peer));

  LOG_NET_DEBUG("add_peer: registered peer={} {} ({}), inbound={} outbound={}", peer_id, peer->endpoint_string(),
                peer->is_inbound() ? "inbound" : "outbound", current_inbound + (peer->is_inbound() ? 1 : 0),
                current_outbound + (peer->is_inbound() ? 0 : 1));
  return peer_id;
}

void PeerLifecycleManager::remove_peer(int peer_id) {
  if (!peer_states_.Erase(peer_id)) {
    // Already removed - this is OK
    LOG_NET_TRACE("remove_peer({}): peer not found", peer_id);
    return;
  }
  LOG_NET_TRACE("remove_peer: erased peer {} from map", peer_id);
}

PeerPtr PeerLifecycleManager::get_peer(int peer_id) const {
  PeerPtr peer;
  peer_states_.Read(peer_id, [&](const PeerTrackingData& state) { peer = state.peer.lock(); });
  return peer;
}

int PeerLifecycleManager::find_peer_by_address(const std::string& address, uint16_t port) const {
  int found = -1;
  peer_states_.ForEach([&](int id, const PeerTrackingData& state) {
    if (found == -1 && state.address == address && (port == 0 || state.port == port)) {
      found = id;
    }
  });
  return found;
}

template <typename Pred>
std::vector<PeerPtr> PeerLifecycleManager::collect(Pred&& pred) const {
  std::vector<PeerPtr> result;
  peer_states_.ForEach([&](int /*id*/, const PeerTrackingData& state) {
    PeerPtr peer = state.peer.lock();
    if (peer && pred(state, *peer)) {
      result.push_back(std::move(peer));
    }
  });
  return result;
}

std::vector<PeerPtr> PeerLifecycleManager::get_all_peers() const {
  return collect([](const PeerTrackingData&, const Peer&) { return true; });
}

std::vector<PeerPtr> PeerLifecycleManager::get_ready_peers() const {
  return collect([](const PeerTrackingData&, const Peer& peer) { return peer.is_ready(); });
}

size_t PeerLifecycleManager::peer_count() const {
  return peer_states_.Size();
}

size_t PeerLifecycleManager::outbound_count() const {
  size_t count = 0;
  peer_states_.ForEach([&](int /*id*/, const PeerTrackingData& state) {
    if (!state.is_inbound()) {
      count++;
    }
  });
  return count;
}

size_t PeerLifecycleManager::inbound_count() const {
  size_t count = 0;
  peer_states_.ForEach([&](int /*id*/, const PeerTrackingData& state) {
    if (state.is_inbound()) {
      count++;
    }
  });
  return count;
}

bool PeerLifecycleManager::needs_more_outbound() const {
  return outbound_count() < config_.max_outbound_peers;
}

void PeerLifecycleManager::disconnect_all(DisconnectReason reason) {
  {
    std::lock_guard<std::mutex> lock(add_mutex_);
    stopping_all_.store(true, std::memory_order_release);
  }

  // Collect first, interrupt outside the map lock
  std::vector<PeerPtr> peers = get_all_peers();
  for (const auto& peer : peers) {
    peer->disconnect(reason);
  }
  if (!peers.empty()) {
    LOG_NET_DEBUG("disconnect_all: interrupted {} sessions ({})", peers.size(), DisconnectReasonToString(reason));
  }
}

}  // namespace network
}  // namespace bitwire
