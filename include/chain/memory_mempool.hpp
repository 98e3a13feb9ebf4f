// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include "chain/mempool_interface.hpp"

#include <mutex>
#include <unordered_map>

namespace bitwire {
namespace chain {

// Largest raw transaction accepted (standardness limit)
constexpr size_t MAX_STANDARD_TX_SIZE = 100000;
constexpr size_t DEFAULT_MAX_MEMPOOL_TRANSACTIONS = 50000;

/**
 * MemoryMempool - in-memory transaction holder keyed by txid
 *
 * No validation: a transaction is rejected only when it is empty, larger
 * than MAX_STANDARD_TX_SIZE, or the pool is full.
 */
class MemoryMempool : public MempoolInterface {
public:
  explicit MemoryMempool(size_t max_transactions = DEFAULT_MAX_MEMPOOL_TRANSACTIONS);

  MempoolAcceptResult submit_transaction(const std::vector<uint8_t>& raw_tx) override;
  bool contains(const uint256& txid) const override;
  std::optional<std::vector<uint8_t>> get_transaction(const uint256& txid) const override;
  std::vector<uint256> get_txids() const override;

  size_t size() const;

private:
  const size_t max_transactions_;
  mutable std::mutex mutex_;
  std::unordered_map<uint256, std::vector<uint8_t>, Uint256Hasher> txs_;
};

}  // namespace chain
}  // namespace bitwire
