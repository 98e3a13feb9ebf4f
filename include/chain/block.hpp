// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

/** Nodes collect new transactions into a block, hash them into a hash tree,
 * and scan through nonce values to make the block's hash satisfy proof-of-work
 * requirements. Only the 80-byte header is interpreted here; transactions are
 * carried as opaque bytes.
 */
class CBlockHeader {
public:
  static constexpr size_t HEADER_SIZE = 80;

  int32_t nVersion{0};
  uint256 hashPrevBlock;
  uint256 hashMerkleRoot;
  uint32_t nTime{0};
  uint32_t nBits{0};
  uint32_t nNonce{0};

  void SetNull() {
    nVersion = 0;
    hashPrevBlock.SetNull();
    hashMerkleRoot.SetNull();
    nTime = 0;
    nBits = 0;
    nNonce = 0;
  }

  bool IsNull() const { return nBits == 0; }

  // Wire layout, all integers little-endian
  std::array<uint8_t, HEADER_SIZE> Serialize() const;

  // Requires at least HEADER_SIZE bytes; reads the first HEADER_SIZE
  bool Deserialize(std::span<const uint8_t> data);

  // Double SHA-256 of the 80-byte serialization
  uint256 GetHash() const;

  std::string ToString() const;

  friend bool operator==(const CBlockHeader& a, const CBlockHeader& b) {
    return a.nVersion == b.nVersion && a.hashPrevBlock == b.hashPrevBlock && a.hashMerkleRoot == b.hashMerkleRoot &&
           a.nTime == b.nTime && a.nBits == b.nBits && a.nNonce == b.nNonce;
  }
};
