// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "chain/memory_mempool.hpp"
#include "util/hash.hpp"

#include <string>
#include <vector>

using namespace bitwire::chain;

namespace {
std::vector<uint8_t> MakeTx(uint8_t tag, size_t size = 60) {
  std::vector<uint8_t> tx(size, tag);
  tx[0] = 0x02;  // version byte
  return tx;
}
}  // namespace

TEST_CASE("MemoryMempool accepts and serves transactions", "[mempool]") {
  MemoryMempool pool;
  auto tx = MakeTx(0xaa);
  const uint256 txid = Hash(tx);

  CHECK(pool.submit_transaction(tx) == MempoolAcceptResult::ACCEPTED);
  CHECK(pool.contains(txid));
  CHECK(pool.size() == 1);

  auto stored = pool.get_transaction(txid);
  REQUIRE(stored.has_value());
  CHECK(*stored == tx);

  auto txids = pool.get_txids();
  REQUIRE(txids.size() == 1);
  CHECK(txids[0] == txid);
}

TEST_CASE("MemoryMempool duplicate submission", "[mempool]") {
  MemoryMempool pool;
  auto tx = MakeTx(0x01);
  CHECK(pool.submit_transaction(tx) == MempoolAcceptResult::ACCEPTED);
  CHECK(pool.submit_transaction(tx) == MempoolAcceptResult::ALREADY_KNOWN);
  CHECK(pool.size() == 1);
}

TEST_CASE("MemoryMempool rejects empty and oversized transactions", "[mempool]") {
  MemoryMempool pool;
  CHECK(pool.submit_transaction({}) == MempoolAcceptResult::REJECTED);
  CHECK(pool.submit_transaction(std::vector<uint8_t>(MAX_STANDARD_TX_SIZE + 1, 0x00)) ==
        MempoolAcceptResult::REJECTED);
  CHECK(pool.submit_transaction(std::vector<uint8_t>(MAX_STANDARD_TX_SIZE, 0x00)) ==
        MempoolAcceptResult::ACCEPTED);
  CHECK(pool.size() == 1);
}

TEST_CASE("MemoryMempool capacity", "[mempool]") {
  MemoryMempool pool(2);
  CHECK(pool.submit_transaction(MakeTx(1)) == MempoolAcceptResult::ACCEPTED);
  CHECK(pool.submit_transaction(MakeTx(2)) == MempoolAcceptResult::ACCEPTED);
  CHECK(pool.submit_transaction(MakeTx(3)) == MempoolAcceptResult::REJECTED);
  // A known transaction is still reported as known when full
  CHECK(pool.submit_transaction(MakeTx(1)) == MempoolAcceptResult::ALREADY_KNOWN);
}

TEST_CASE("MemoryMempool lookups for unknown txids", "[mempool]") {
  MemoryMempool pool;
  CHECK_FALSE(pool.contains(uint256::ONE));
  CHECK_FALSE(pool.get_transaction(uint256::ONE).has_value());
  CHECK(pool.get_txids().empty());
  CHECK(std::string(MempoolAcceptResultToString(MempoolAcceptResult::ALREADY_KNOWN)) == "already-known");
}
