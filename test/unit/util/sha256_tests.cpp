// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "util/hash.hpp"
#include "util/sha256.hpp"

#include <cstring>
#include <string>
#include <vector>

namespace {

struct DigestVector {
  const char* input;
  const char* expected_hex;
};

// FIPS 180-2 and Bitcoin Core crypto_tests vectors
const DigestVector kSingleVectors[] = {
    {"", "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"},
    {"abc", "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"},
    {"message digest", "f7846f55cf23e14eebeab5b4e1550cad5b509e3348fbc4efa3a1413d393cb650"},
    {"abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq",
     "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1"},
    {"This is exactly 64 bytes long, not counting the terminating byte",
     "ab64eff7e88e2e46165e29f2bce41826bd4c7b3552f6b382a9e7d3af47c245f8"},
    {"As Bitcoin relies on 80 byte header hashes, we want to have an example for that.",
     "7406e8de7d6e4fffc573daef05aefb8806e7790f55eab5576f31349743cca743"},
};

std::string ToHex(const uint8_t* data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

std::string Sha256Hex(const std::string& input) {
  uint8_t out[CSHA256::OUTPUT_SIZE];
  CSHA256().Write(reinterpret_cast<const unsigned char*>(input.data()), input.size()).Finalize(out);
  return ToHex(out, sizeof(out));
}

}  // namespace

TEST_CASE("SHA256 matches known digests", "[sha256][crypto]") {
  for (const auto& tv : kSingleVectors) {
    INFO("input: " << tv.input);
    CHECK(Sha256Hex(tv.input) == tv.expected_hex);
  }
}

TEST_CASE("SHA256 chunked writes equal a single write", "[sha256][crypto]") {
  const std::string text = "abcdefghijklmnopqrstuvwxyz";

  uint8_t whole[32], halves[32], bytewise[32];
  CSHA256().Write(reinterpret_cast<const unsigned char*>(text.data()), text.size()).Finalize(whole);

  CSHA256 two;
  two.Write(reinterpret_cast<const unsigned char*>(text.data()), 13);
  two.Write(reinterpret_cast<const unsigned char*>(text.data()) + 13, 13);
  two.Finalize(halves);

  CSHA256 one;
  for (char c : text) {
    one.Write(reinterpret_cast<const unsigned char*>(&c), 1);
  }
  one.Finalize(bytewise);

  CHECK(std::memcmp(whole, halves, 32) == 0);
  CHECK(std::memcmp(whole, bytewise, 32) == 0);
  CHECK(ToHex(whole, 32) == "71c480df93d6ae2f1efad1447c66c9525e316218cf51fc8d9ed832f2daf18b73");
}

TEST_CASE("SHA256 Reset discards buffered input", "[sha256][crypto]") {
  CSHA256 hasher;
  hasher.Write(reinterpret_cast<const unsigned char*>("garbage"), 7);
  hasher.Reset();
  hasher.Write(reinterpret_cast<const unsigned char*>("abc"), 3);
  uint8_t out[32];
  hasher.Finalize(out);
  CHECK(ToHex(out, 32) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SHA256 one million 'a' characters", "[sha256][crypto]") {
  CSHA256 hasher;
  const std::string block(1000, 'a');
  for (int i = 0; i < 1000; ++i) {
    hasher.Write(reinterpret_cast<const unsigned char*>(block.data()), block.size());
  }
  uint8_t out[32];
  hasher.Finalize(out);
  CHECK(ToHex(out, 32) == "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST_CASE("Double SHA256 frame checksum", "[sha256][hash]") {
  SECTION("empty payload") {
    std::vector<uint8_t> empty;
    auto sum = Checksum(empty);
    CHECK(ToHex(sum.data(), sum.size()) == "5df6e0e2");
  }

  SECTION("checksum is the prefix of Hash") {
    std::vector<uint8_t> payload{'h', 'e', 'l', 'l', 'o'};
    uint256 full = Hash(payload);
    auto sum = Checksum(payload);
    CHECK(std::memcmp(sum.data(), full.begin(), 4) == 0);
  }

  SECTION("double hash of empty input") {
    uint256 h = Hash(std::vector<uint8_t>{});
    CHECK(ToHex(h.begin(), 32) == "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
  }
}
