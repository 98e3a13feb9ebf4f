// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "chain/memory_mempool.hpp"

#include "util/hash.hpp"
#include "util/logging.hpp"

namespace bitwire {
namespace chain {

const char* MempoolAcceptResultToString(MempoolAcceptResult result) {
  switch (result) {
  case MempoolAcceptResult::ACCEPTED:
    return "accepted";
  case MempoolAcceptResult::REJECTED:
    return "rejected";
  case MempoolAcceptResult::ALREADY_KNOWN:
    return "already-known";
  }
  return "unknown";
}

MemoryMempool::MemoryMempool(size_t max_transactions) : max_transactions_(max_transactions) {}

MempoolAcceptResult MemoryMempool::submit_transaction(const std::vector<uint8_t>& raw_tx) {
  if (raw_tx.empty() || raw_tx.size() > MAX_STANDARD_TX_SIZE) {
    LOG_CHAIN_DEBUG("mempool: rejecting transaction of size {}", raw_tx.size());
    return MempoolAcceptResult::REJECTED;
  }

  const uint256 txid = Hash(raw_tx);

  std::lock_guard<std::mutex> lock(mutex_);
  if (txs_.count(txid)) {
    return MempoolAcceptResult::ALREADY_KNOWN;
  }
  if (txs_.size() >= max_transactions_) {
    LOG_CHAIN_DEBUG("mempool: full ({} transactions), rejecting {}", txs_.size(), txid.GetHex());
    return MempoolAcceptResult::REJECTED;
  }

  txs_.emplace(txid, raw_tx);
  LOG_CHAIN_TRACE("mempool: accepted {} ({} bytes)", txid.GetHex(), raw_tx.size());
  return MempoolAcceptResult::ACCEPTED;
}

bool MemoryMempool::contains(const uint256& txid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return txs_.count(txid) > 0;
}

std::optional<std::vector<uint8_t>> MemoryMempool::get_transaction(const uint256& txid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = txs_.find(txid);
  if (it == txs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<uint256> MemoryMempool::get_txids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint256> txids;
  txids.reserve(txs_.size());
  for (const auto& [txid, raw] : txs_) {
    txids.push_back(txid);
  }
  return txids;
}

size_t MemoryMempool::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return txs_.size();
}

}  // namespace chain
}  // namespace bitwire
