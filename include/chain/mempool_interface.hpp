// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

/*
 MempoolInterface - what the P2P engine needs from a transaction pool

 The engine never validates transactions. It hands raw bytes received in
 "tx" messages to submit_transaction() and serves "getdata" requests for
 transactions through get_transaction().
*/

#include "util/uint.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace bitwire {
namespace chain {

enum class MempoolAcceptResult {
  ACCEPTED,       // New transaction stored; announce it to other peers
  REJECTED,       // Pool policy refused it
  ALREADY_KNOWN,  // Same txid already in the pool
};

const char* MempoolAcceptResultToString(MempoolAcceptResult result);

class MempoolInterface {
public:
  virtual ~MempoolInterface() = default;

  // Called for every "tx" message from a READY peer
  virtual MempoolAcceptResult submit_transaction(const std::vector<uint8_t>& raw_tx) = 0;

  virtual bool contains(const uint256& txid) const = 0;

  virtual std::optional<std::vector<uint8_t>> get_transaction(const uint256& txid) const = 0;

  // All txids currently held (answers "mempool" requests)
  virtual std::vector<uint256> get_txids() const = 0;
};

}  // namespace chain
}  // namespace bitwire
