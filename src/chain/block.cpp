// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "chain/block.hpp"

#include "util/hash.hpp"

#include <cstring>
#include <sstream>

namespace {

void WriteLE32(uint8_t* ptr, uint32_t x) {
  ptr[0] = static_cast<uint8_t>(x);
  ptr[1] = static_cast<uint8_t>(x >> 8);
  ptr[2] = static_cast<uint8_t>(x >> 16);
  ptr[3] = static_cast<uint8_t>(x >> 24);
}

uint32_t ReadLE32(const uint8_t* ptr) {
  return uint32_t(ptr[0]) | (uint32_t(ptr[1]) << 8) | (uint32_t(ptr[2]) << 16) | (uint32_t(ptr[3]) << 24);
}

}  // namespace

std::array<uint8_t, CBlockHeader::HEADER_SIZE> CBlockHeader::Serialize() const {
  std::array<uint8_t, HEADER_SIZE> out{};
  WriteLE32(out.data(), static_cast<uint32_t>(nVersion));
  std::memcpy(out.data() + 4, hashPrevBlock.data(), 32);
  std::memcpy(out.data() + 36, hashMerkleRoot.data(), 32);
  WriteLE32(out.data() + 68, nTime);
  WriteLE32(out.data() + 72, nBits);
  WriteLE32(out.data() + 76, nNonce);
  return out;
}

bool CBlockHeader::Deserialize(std::span<const uint8_t> data) {
  if (data.size() < HEADER_SIZE) {
    return false;
  }
  nVersion = static_cast<int32_t>(ReadLE32(data.data()));
  std::memcpy(hashPrevBlock.data(), data.data() + 4, 32);
  std::memcpy(hashMerkleRoot.data(), data.data() + 36, 32);
  nTime = ReadLE32(data.data() + 68);
  nBits = ReadLE32(data.data() + 72);
  nNonce = ReadLE32(data.data() + 76);
  return true;
}

uint256 CBlockHeader::GetHash() const {
  auto bytes = Serialize();
  return Hash(std::span<const uint8_t>(bytes.data(), bytes.size()));
}

std::string CBlockHeader::ToString() const {
  std::stringstream s;
  s << "CBlockHeader(hash=" << GetHash().ToString() << ", ver=0x" << std::hex << nVersion << std::dec
    << ", hashPrevBlock=" << hashPrevBlock.ToString() << ", hashMerkleRoot=" << hashMerkleRoot.ToString()
    << ", nTime=" << nTime << ", nBits=" << std::hex << nBits << std::dec << ", nNonce=" << nNonce << ")";
  return s.str();
}
