// Copyright (c) 2014-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include <cstddef>
#include <cstdint>

/** A hasher class for SHA-256. */
class CSHA256 {
private:
  uint32_t s[8];
  unsigned char buf[64];
  uint64_t bytes{0};

public:
  static const size_t OUTPUT_SIZE = 32;

  CSHA256();
  CSHA256& Write(const unsigned char* data, size_t len);
  void Finalize(unsigned char hash[OUTPUT_SIZE]);
  CSHA256& Reset();
};
