// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "util/uint.hpp"

#include <string>

TEST_CASE("uint256 hex is printed in display byte order", "[uint256]") {
  uint256 one(uint8_t{1});
  CHECK(one.GetHex() == std::string(63, '0') + "1");
  CHECK(one.begin()[0] == 1);
  CHECK(one.begin()[31] == 0);
}

TEST_CASE("uint256 SetHex", "[uint256]") {
  SECTION("accepts a 0x prefix and short input") {
    uint256 v;
    v.SetHex("0xff");
    CHECK(v.begin()[0] == 0xff);
    CHECK(v.GetHex() == std::string(62, '0') + "ff");
  }

  SECTION("odd-length input keeps the trailing nibble low") {
    uint256 v;
    v.SetHex("abc");
    CHECK(v.begin()[0] == 0xbc);
    CHECK(v.begin()[1] == 0x0a);
  }

  SECTION("non-hex input leaves the value unchanged") {
    uint256 v(uint8_t{7});
    v.SetHex("zz");
    CHECK(v == uint256(uint8_t{7}));
  }

  SECTION("overlong input is ignored") {
    uint256 v;
    v.SetHex(std::string(65, 'a'));
    CHECK(v.IsNull());
  }
}

TEST_CASE("uint256 FromHex requires exactly 64 hex digits", "[uint256]") {
  const std::string genesis = "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f";
  auto parsed = uint256::FromHex(genesis);
  REQUIRE(parsed.has_value());
  CHECK(parsed->GetHex() == genesis);

  CHECK_FALSE(uint256::FromHex(genesis.substr(1)).has_value());
  CHECK_FALSE(uint256::FromHex(genesis + "0").has_value());
  CHECK_FALSE(uint256::FromHex(std::string(63, '0') + "g").has_value());
}

TEST_CASE("uint256 comparison and null checks", "[uint256]") {
  uint256 zero;
  CHECK(zero.IsNull());
  CHECK(zero == uint256::ZERO);
  CHECK(uint256::ONE != uint256::ZERO);
  CHECK(uint256::ZERO < uint256::ONE);

  uint256 v = uint256::ONE;
  v.SetNull();
  CHECK(v.IsNull());
}
