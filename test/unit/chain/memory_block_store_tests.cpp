// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "chain/chainparams.hpp"
#include "chain/memory_block_store.hpp"

#include <vector>

using namespace bitwire::chain;

namespace {

// Headers are not validated, so any field values chain as long as hashPrevBlock links
std::vector<CBlockHeader> BuildChain(const CBlockHeader& parent, int count, uint32_t nonce_base = 0) {
  std::vector<CBlockHeader> headers;
  uint256 prev = parent.GetHash();
  for (int i = 0; i < count; ++i) {
    CBlockHeader h;
    h.nVersion = 4;
    h.hashPrevBlock = prev;
    h.nTime = parent.nTime + 600 * (i + 1);
    h.nBits = 0x207fffff;
    h.nNonce = nonce_base + static_cast<uint32_t>(i);
    prev = h.GetHash();
    headers.push_back(h);
  }
  return headers;
}

std::vector<uint8_t> BlockBytes(const CBlockHeader& header) {
  auto raw = header.Serialize();
  std::vector<uint8_t> block(raw.begin(), raw.end());
  block.push_back(0x00);  // zero transactions
  return block;
}

}  // namespace

TEST_CASE("MemoryBlockStore starts at genesis", "[block_store]") {
  auto params = ChainParams::CreateRegTest();
  MemoryBlockStore store(params->GenesisBlock());

  auto tip = store.chain_tip();
  CHECK(tip.height == 0);
  CHECK(tip.hash == params->GenesisHash());
  CHECK(store.has_header(params->GenesisHash()));
  CHECK_FALSE(store.has_block(params->GenesisHash()));
  CHECK(store.block_count() == 0);
}

TEST_CASE("MemoryBlockStore accept_headers", "[block_store]") {
  auto params = ChainParams::CreateRegTest();
  MemoryBlockStore store(params->GenesisBlock());
  auto headers = BuildChain(params->GenesisBlock(), 5);

  SECTION("connects a linked batch") {
    CHECK(store.accept_headers(headers) == 5);
    CHECK(store.chain_tip().height == 5);
    CHECK(store.chain_tip().hash == headers.back().GetHash());
  }

  SECTION("known headers are skipped") {
    CHECK(store.accept_headers(headers) == 5);
    CHECK(store.accept_headers(headers) == 0);
    CHECK(store.chain_tip().height == 5);
  }

  SECTION("a header that does not extend the tip stops the batch") {
    std::vector<CBlockHeader> gap{headers[0], headers[2], headers[3]};
    CHECK(store.accept_headers(gap) == 1);
    CHECK(store.chain_tip().height == 1);
  }

  SECTION("forks are ignored") {
    store.accept_headers(headers);
    auto fork = BuildChain(params->GenesisBlock(), 2, 1000);
    CHECK(store.accept_headers(fork) == 0);
    CHECK_FALSE(store.has_header(fork[0].GetHash()));
  }
}

TEST_CASE("MemoryBlockStore get_headers from a locator", "[block_store]") {
  auto params = ChainParams::CreateRegTest();
  MemoryBlockStore store(params->GenesisBlock());
  auto headers = BuildChain(params->GenesisBlock(), 20);
  REQUIRE(store.accept_headers(headers) == 20);

  SECTION("starts after the first matching locator entry") {
    auto result = store.get_headers({headers[9].GetHash()}, uint256(), 2000);
    REQUIRE(result.size() == 10);
    CHECK(result.front() == headers[10]);
    CHECK(result.back() == headers[19]);
  }

  SECTION("unknown locator falls back to genesis") {
    auto result = store.get_headers({uint256::ONE}, uint256(), 2000);
    CHECK(result.size() == 20);
  }

  SECTION("hash_stop is inclusive") {
    auto result = store.get_headers({params->GenesisHash()}, headers[4].GetHash(), 2000);
    REQUIRE(result.size() == 5);
    CHECK(result.back() == headers[4]);
  }

  SECTION("max_headers caps the response") {
    CHECK(store.get_headers({}, uint256(), 3).size() == 3);
  }

  SECTION("locator is dense near the tip and ends at genesis") {
    auto locator = store.get_locator();
    REQUIRE(locator.size() >= 11);
    CHECK(locator.front() == headers[19].GetHash());
    CHECK(locator[9] == headers[10].GetHash());
    CHECK(locator.back() == params->GenesisHash());
  }
}

TEST_CASE("MemoryBlockStore accept_block", "[block_store]") {
  auto params = ChainParams::CreateRegTest();
  MemoryBlockStore store(params->GenesisBlock());
  auto headers = BuildChain(params->GenesisBlock(), 1);
  auto raw = BlockBytes(headers[0]);
  const uint256 hash = headers[0].GetHash();

  CHECK(store.accept_block(hash, raw));
  CHECK(store.has_block(hash));
  CHECK(store.chain_tip().hash == hash);
  REQUIRE(store.get_block(hash).has_value());
  CHECK(*store.get_block(hash) == raw);

  // Duplicate
  CHECK_FALSE(store.accept_block(hash, raw));

  // Hash mismatch and short payload
  CHECK_FALSE(store.accept_block(uint256::ONE, raw));
  CHECK_FALSE(store.accept_block(hash, std::vector<uint8_t>(10, 0)));
  CHECK(store.block_count() == 1);
}

TEST_CASE("MemoryBlockStore drops blocks that do not connect", "[block_store]") {
  auto params = ChainParams::CreateRegTest();
  MemoryBlockStore store(params->GenesisBlock());

  CBlockHeader orphan = BuildChain(params->GenesisBlock(), 1)[0];
  orphan.hashPrevBlock = uint256(0xde);

  CHECK_FALSE(store.accept_block(orphan.GetHash(), BlockBytes(orphan)));
  CHECK_FALSE(store.has_block(orphan.GetHash()));
  CHECK_FALSE(store.has_header(orphan.GetHash()));
  CHECK(store.block_count() == 0);
  CHECK(store.chain_tip().height == 0);

  SECTION("a body for a header accepted earlier is stored") {
    auto chain = BuildChain(params->GenesisBlock(), 3);
    REQUIRE(store.accept_headers(chain) == 3);
    CHECK(store.accept_block(chain[1].GetHash(), BlockBytes(chain[1])));
    CHECK(store.chain_tip().height == 3);
    CHECK(store.block_count() == 1);
  }
}

TEST_CASE("MemoryBlockStore keeps at most max_blocks bodies", "[block_store]") {
  auto params = ChainParams::CreateRegTest();
  MemoryBlockStore store(params->GenesisBlock(), 2);
  auto chain = BuildChain(params->GenesisBlock(), 3);

  CHECK(store.accept_block(chain[0].GetHash(), BlockBytes(chain[0])));
  CHECK(store.accept_block(chain[1].GetHash(), BlockBytes(chain[1])));
  CHECK_FALSE(store.accept_block(chain[2].GetHash(), BlockBytes(chain[2])));
  CHECK(store.block_count() == 2);
  CHECK(store.chain_tip().hash == chain[1].GetHash());
}
