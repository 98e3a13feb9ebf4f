#pragma once

#include "network/peer.hpp"
#include "util/time.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace bitwire {
namespace network {

// PeerTrackingData - Registry entry for one session
//
// The registry never owns a session: the session thread holds the PeerPtr and
// the entry only keeps a control handle plus a snapshot of identity fields, so
// counts and lookups stay valid while the session is tearing down.
struct PeerTrackingData {
  std::weak_ptr<Peer> peer;

  std::string address;
  uint16_t port{0};
  PeerDirection direction{PeerDirection::OUTBOUND};

  // Registration time (for uptime diagnostics)
  std::chrono::steady_clock::time_point created_at;

  PeerTrackingData() = default;
  explicit PeerTrackingData(const PeerPtr& p, std::chrono::steady_clock::time_point created = util::GetSteadyTime())
      : peer(p), address(p->address()), port(p->port()), direction(p->direction()), created_at(created) {}

  bool is_inbound() const { return direction == PeerDirection::INBOUND; }
};

}  // namespace network
}  // namespace bitwire
