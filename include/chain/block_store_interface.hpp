// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

/*
 BlockStoreInterface - what the P2P engine needs from block storage

 Answers "getdata"/"getheaders"/"getblocks" and stores incoming "headers"
 and "block" payloads. Storage format and validation are the implementer's
 business; block bodies are opaque bytes here.
*/

#include "chain/block.hpp"
#include "util/uint.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace bitwire {
namespace chain {

struct ChainTip {
  uint256 hash;
  int height{0};
};

class BlockStoreInterface {
public:
  virtual ~BlockStoreInterface() = default;

  // Full serialized block, or nullopt if not stored
  virtual std::optional<std::vector<uint8_t>> get_block(const uint256& hash) const = 0;

  // Headers following the first locator hash on our active chain, stopping
  // after hash_stop (if non-null) or after max_headers entries
  virtual std::vector<CBlockHeader> get_headers(const std::vector<uint256>& locator, const uint256& hash_stop,
                                                size_t max_headers) const = 0;

  virtual ChainTip chain_tip() const = 0;

  virtual bool has_block(const uint256& hash) const = 0;

  // True if the header is known (on the active chain or stored)
  virtual bool has_header(const uint256& hash) const = 0;

  // Returns the number of headers that extended the active chain
  virtual size_t accept_headers(const std::vector<CBlockHeader>& headers) = 0;

  // Returns true if the block was stored now. False for duplicates, blocks
  // that do not connect to a known header, and anything the store refuses.
  virtual bool accept_block(const uint256& hash, const std::vector<uint8_t>& raw_block) = 0;
};

}  // namespace chain
}  // namespace bitwire
