// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "util/uint.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bitwire {
namespace chain {

enum class ChainType {
  MAIN,     // Production network
  TESTNET,  // testnet3
  REGTEST,  // Local regression testing
  SIGNET,   // Default signet
};

// Parses "main", "test"/"testnet3", "regtest", "signet"
std::optional<ChainType> ChainTypeFromString(const std::string& name);

/**
 * ChainParams - per-network constants the P2P engine needs
 *
 * Network identity (magic), default P2P port, DNS seeds and the genesis
 * header used to seed the in-memory block store.
 */
class ChainParams {
public:
  virtual ~ChainParams() = default;

  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;

  uint32_t GetNetworkMagic() const;
  uint16_t GetDefaultPort() const { return nDefaultPort; }

  const std::vector<std::string>& DNSSeeds() const { return vSeeds; }
  const CBlockHeader& GenesisBlock() const { return genesis; }
  const uint256& GenesisHash() const { return hashGenesisBlock; }

  static std::unique_ptr<ChainParams> CreateMainNet();
  static std::unique_ptr<ChainParams> CreateTestNet();
  static std::unique_ptr<ChainParams> CreateRegTest();
  static std::unique_ptr<ChainParams> CreateSigNet();
  static std::unique_ptr<ChainParams> Create(ChainType chain);

protected:
  ChainParams() = default;

  ChainType chainType{ChainType::MAIN};
  uint16_t nDefaultPort{0};
  std::vector<std::string> vSeeds;
  CBlockHeader genesis;
  uint256 hashGenesisBlock;
};

class CMainParams : public ChainParams {
public:
  CMainParams();
};

class CTestNetParams : public ChainParams {
public:
  CTestNetParams();
};

class CRegTestParams : public ChainParams {
public:
  CRegTestParams();
};

class CSigNetParams : public ChainParams {
public:
  CSigNetParams();
};

CBlockHeader CreateGenesisBlock(uint32_t nTime, uint32_t nNonce, uint32_t nBits, int32_t nVersion);

}  // namespace chain
}  // namespace bitwire
