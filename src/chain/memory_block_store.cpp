// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "chain/memory_block_store.hpp"

#include "util/logging.hpp"

#include <span>

namespace bitwire {
namespace chain {

MemoryBlockStore::MemoryBlockStore(const CBlockHeader& genesis, size_t max_blocks) : max_blocks_(max_blocks) {
  active_chain_.push_back(genesis);
  height_index_.emplace(genesis.GetHash(), 0);
}

std::optional<std::vector<uint8_t>> MemoryBlockStore::get_block(const uint256& hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = blocks_.find(hash);
  if (it == blocks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<CBlockHeader> MemoryBlockStore::get_headers(const std::vector<uint256>& locator, const uint256& hash_stop,
                                                        size_t max_headers) const {
  std::lock_guard<std::mutex> lock(mutex_);

  // Fork point is the first locator entry on our active chain; genesis if none match
  int fork_height = 0;
  for (const auto& hash : locator) {
    auto it = height_index_.find(hash);
    if (it != height_index_.end()) {
      fork_height = it->second;
      break;
    }
  }

  std::vector<CBlockHeader> result;
  for (size_t h = static_cast<size_t>(fork_height) + 1; h < active_chain_.size() && result.size() < max_headers;
       ++h) {
    result.push_back(active_chain_[h]);
    if (!hash_stop.IsNull() && active_chain_[h].GetHash() == hash_stop) {
      break;
    }
  }
  return result;
}

ChainTip MemoryBlockStore::chain_tip() const {
  std::lock_guard<std::mutex> lock(mutex_);
  ChainTip tip;
  tip.hash = active_chain_.back().GetHash();
  tip.height = static_cast<int>(active_chain_.size()) - 1;
  return tip;
}

bool MemoryBlockStore::has_block(const uint256& hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.count(hash) > 0;
}

bool MemoryBlockStore::has_header(const uint256& hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return height_index_.count(hash) > 0;
}

size_t MemoryBlockStore::accept_headers(const std::vector<CBlockHeader>& headers) {
  std::lock_guard<std::mutex> lock(mutex_);
  return accept_headers_locked(headers);
}

size_t MemoryBlockStore::accept_headers_locked(const std::vector<CBlockHeader>& headers) {
  size_t connected = 0;
  for (const auto& header : headers) {
    const uint256 hash = header.GetHash();
    if (height_index_.count(hash)) {
      continue;
    }
    if (header.hashPrevBlock != active_chain_.back().GetHash()) {
      LOG_CHAIN_DEBUG("block store: header {} does not extend tip, ignoring rest of batch", hash.GetHex());
      break;
    }
    height_index_.emplace(hash, static_cast<int>(active_chain_.size()));
    active_chain_.push_back(header);
    ++connected;
  }
  if (connected > 0) {
    LOG_CHAIN_DEBUG("block store: connected {} headers, tip height={}", connected, active_chain_.size() - 1);
  }
  return connected;
}

bool MemoryBlockStore::accept_block(const uint256& hash, const std::vector<uint8_t>& raw_block) {
  CBlockHeader header;
  if (!header.Deserialize(std::span<const uint8_t>(raw_block.data(), raw_block.size()))) {
    LOG_CHAIN_WARN("block store: block {} shorter than a header", hash.GetHex());
    return false;
  }
  if (header.GetHash() != hash) {
    LOG_CHAIN_WARN("block store: block hash mismatch for {}", hash.GetHex());
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (blocks_.count(hash)) {
    return false;
  }
  if (blocks_.size() >= max_blocks_) {
    LOG_CHAIN_WARN("block store: full ({} blocks), dropping {}", blocks_.size(), hash.GetHex());
    return false;
  }
  if (!height_index_.count(hash) && accept_headers_locked({header}) == 0) {
    LOG_CHAIN_DEBUG("block store: block {} does not connect (prev {}), dropping", hash.GetHex(),
                    header.hashPrevBlock.GetHex());
    return false;
  }
  blocks_.emplace(hash, raw_block);
  LOG_CHAIN_DEBUG("block store: stored block {} ({} bytes)", hash.GetHex(), raw_block.size());
  return true;
}

std::vector<uint256> MemoryBlockStore::get_locator() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint256> locator;
  int step = 1;
  int height = static_cast<int>(active_chain_.size()) - 1;
  while (height > 0) {
    locator.push_back(active_chain_[height].GetHash());
    if (locator.size() >= 10) {
      step *= 2;
    }
    height -= step;
  }
  locator.push_back(active_chain_.front().GetHash());
  return locator;
}

size_t MemoryBlockStore::block_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.size();
}

}  // namespace chain
}  // namespace bitwire
