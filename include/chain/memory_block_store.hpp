// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include "chain/block_store_interface.hpp"

#include <mutex>
#include <unordered_map>
#include <vector>

namespace bitwire {
namespace chain {

/**
 * MemoryBlockStore - in-memory header chain plus opaque block bodies
 *
 * Keeps a single linear active chain starting at the genesis header.
 * A header extends the chain only if its hashPrevBlock is the current tip;
 * forks and orphans are ignored (no validation, no reorgs). A block body is
 * stored only when its header is already known or connects to the tip, and
 * at most max_blocks bodies are kept.
 *
 * Thread-safety: all methods lock an internal mutex.
 */
class MemoryBlockStore : public BlockStoreInterface {
public:
  static constexpr size_t DEFAULT_MAX_BLOCKS = 1000;

  explicit MemoryBlockStore(const CBlockHeader& genesis, size_t max_blocks = DEFAULT_MAX_BLOCKS);

  std::optional<std::vector<uint8_t>> get_block(const uint256& hash) const override;
  std::vector<CBlockHeader> get_headers(const std::vector<uint256>& locator, const uint256& hash_stop,
                                        size_t max_headers) const override;
  ChainTip chain_tip() const override;
  bool has_block(const uint256& hash) const override;
  bool has_header(const uint256& hash) const override;
  size_t accept_headers(const std::vector<CBlockHeader>& headers) override;
  bool accept_block(const uint256& hash, const std::vector<uint8_t>& raw_block) override;

  // Block locator for the active chain (dense for the last 10, then exponential)
  std::vector<uint256> get_locator() const;

  size_t block_count() const;

private:
  // Caller holds mutex_
  size_t accept_headers_locked(const std::vector<CBlockHeader>& headers);

  const size_t max_blocks_;
  mutable std::mutex mutex_;
  std::vector<CBlockHeader> active_chain_;                       // index = height
  std::unordered_map<uint256, int, Uint256Hasher> height_index_;  // hash -> height on active_chain_
  std::unordered_map<uint256, std::vector<uint8_t>, Uint256Hasher> blocks_;
};

}  // namespace chain
}  // namespace bitwire
