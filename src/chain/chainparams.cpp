// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "chain/chainparams.hpp"

#include "network/protocol.hpp"

namespace bitwire {
namespace chain {

// Merkle root of the single coinbase shared by every Bitcoin genesis block
static const char* const GENESIS_MERKLE_ROOT = "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";

std::optional<ChainType> ChainTypeFromString(const std::string& name) {
  if (name == "main" || name == "mainnet") {
    return ChainType::MAIN;
  }
  if (name == "test" || name == "testnet" || name == "testnet3") {
    return ChainType::TESTNET;
  }
  if (name == "regtest") {
    return ChainType::REGTEST;
  }
  if (name == "signet") {
    return ChainType::SIGNET;
  }
  return std::nullopt;
}

CBlockHeader CreateGenesisBlock(uint32_t nTime, uint32_t nNonce, uint32_t nBits, int32_t nVersion) {
  CBlockHeader genesis;
  genesis.nVersion = nVersion;
  genesis.hashPrevBlock.SetNull();
  genesis.hashMerkleRoot.SetHex(GENESIS_MERKLE_ROOT);
  genesis.nTime = nTime;
  genesis.nBits = nBits;
  genesis.nNonce = nNonce;
  return genesis;
}

std::string ChainParams::GetChainTypeString() const {
  switch (chainType) {
  case ChainType::MAIN:
    return "main";
  case ChainType::TESTNET:
    return "testnet3";
  case ChainType::REGTEST:
    return "regtest";
  case ChainType::SIGNET:
    return "signet";
  }
  return "unknown";
}

uint32_t ChainParams::GetNetworkMagic() const {
  switch (chainType) {
  case ChainType::MAIN:
    return protocol::magic::MAINNET;
  case ChainType::TESTNET:
    return protocol::magic::TESTNET3;
  case ChainType::REGTEST:
    return protocol::magic::REGTEST;
  case ChainType::SIGNET:
    return protocol::magic::SIGNET;
  }
  return 0;
}

std::unique_ptr<ChainParams> ChainParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateTestNet() {
  return std::make_unique<CTestNetParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateRegTest() {
  return std::make_unique<CRegTestParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateSigNet() {
  return std::make_unique<CSigNetParams>();
}

std::unique_ptr<ChainParams> ChainParams::Create(ChainType chain) {
  switch (chain) {
  case ChainType::MAIN:
    return CreateMainNet();
  case ChainType::TESTNET:
    return CreateTestNet();
  case ChainType::REGTEST:
    return CreateRegTest();
  case ChainType::SIGNET:
    return CreateSigNet();
  }
  return CreateMainNet();
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams() {
  chainType = ChainType::MAIN;
  nDefaultPort = protocol::ports::MAINNET;

  // 000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f
  genesis = CreateGenesisBlock(1231006505, 2083236893, 0x1d00ffff, 1);
  hashGenesisBlock = genesis.GetHash();

  vSeeds.emplace_back("seed.bitcoin.sipa.be");
  vSeeds.emplace_back("dnsseed.bluematt.me");
  vSeeds.emplace_back("seed.bitcoin.jonasschnelli.ch");
  vSeeds.emplace_back("seed.btc.petertodd.net");
  vSeeds.emplace_back("seed.bitcoin.sprovoost.nl");
  vSeeds.emplace_back("dnsseed.emzy.de");
  vSeeds.emplace_back("seed.bitcoin.wiz.biz");
}

// ============================================================================
// TestNet Parameters
// ============================================================================

CTestNetParams::CTestNetParams() {
  chainType = ChainType::TESTNET;
  nDefaultPort = protocol::ports::TESTNET3;

  // 000000000933ea01ad0ee984209779baaec3ced90fa3f408719526f8d77f4943
  genesis = CreateGenesisBlock(1296688602, 414098458, 0x1d00ffff, 1);
  hashGenesisBlock = genesis.GetHash();

  vSeeds.emplace_back("testnet-seed.bitcoin.jonasschnelli.ch");
  vSeeds.emplace_back("seed.tbtc.petertodd.net");
  vSeeds.emplace_back("seed.testnet.bitcoin.sprovoost.nl");
  vSeeds.emplace_back("testnet-seed.bluematt.me");
}

// ============================================================================
// RegTest Parameters (Local testing)
// ============================================================================

CRegTestParams::CRegTestParams() {
  chainType = ChainType::REGTEST;
  nDefaultPort = protocol::ports::REGTEST;

  // 0f9188f13cb7b2c71f2a335e3a4fc328bf5beb436012afca590b1a11466e2206
  genesis = CreateGenesisBlock(1296688602, 2, 0x207fffff, 1);
  hashGenesisBlock = genesis.GetHash();

  vSeeds.clear();  // No DNS seeds for local testing
}

// ============================================================================
// SigNet Parameters
// ============================================================================

CSigNetParams::CSigNetParams() {
  chainType = ChainType::SIGNET;
  nDefaultPort = protocol::ports::SIGNET;

  genesis = CreateGenesisBlock(1598918400, 52613770, 0x1e0377ae, 1);
  hashGenesisBlock = genesis.GetHash();

  vSeeds.emplace_back("seed.signet.bitcoin.sprovoost.nl");
}

}  // namespace chain
}  // namespace bitwire
