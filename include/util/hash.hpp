// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "util/sha256.hpp"
#include "util/uint.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

/** A hasher class for Bitcoin's 256-bit hash (double SHA-256). */
class CHash256 {
private:
  CSHA256 sha;

public:
  static const size_t OUTPUT_SIZE = CSHA256::OUTPUT_SIZE;

  void Finalize(unsigned char output[OUTPUT_SIZE]) {
    unsigned char buf[CSHA256::OUTPUT_SIZE];
    sha.Finalize(buf);
    sha.Reset().Write(buf, CSHA256::OUTPUT_SIZE).Finalize(output);
  }

  void Finalize(uint256& output) { Finalize(output.begin()); }

  CHash256& Write(const unsigned char* data, size_t len) {
    sha.Write(data, len);
    return *this;
  }

  CHash256& Reset() {
    sha.Reset();
    return *this;
  }
};

/** Compute the 256-bit hash of a byte span (double SHA-256). */
inline uint256 Hash(std::span<const uint8_t> data) {
  uint256 result;
  CHash256().Write(data.data(), data.size()).Finalize(result);
  return result;
}

inline uint256 Hash(const std::vector<uint8_t>& data) {
  return Hash(std::span<const uint8_t>(data.data(), data.size()));
}

/** First four bytes of the double SHA-256, used as the frame checksum. */
inline std::array<uint8_t, 4> Checksum(std::span<const uint8_t> data) {
  uint256 h = Hash(data);
  return {h.begin()[0], h.begin()[1], h.begin()[2], h.begin()[3]};
}
