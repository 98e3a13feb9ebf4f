// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/uint.hpp"

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

template <unsigned int BITS>
std::string base_blob<BITS>::GetHex() const {
  static const char hexmap[] = "0123456789abcdef";
  std::string out;
  out.reserve(WIDTH * 2);
  for (int i = WIDTH - 1; i >= 0; --i) {
    out.push_back(hexmap[m_data[i] >> 4]);
    out.push_back(hexmap[m_data[i] & 0x0f]);
  }
  return out;
}

template <unsigned int BITS>
void base_blob<BITS>::SetHex(std::string_view str) {
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }
  if (str.size() > static_cast<size_t>(WIDTH) * 2) {
    return;
  }
  for (char c : str) {
    if (HexDigit(c) < 0) {
      return;
    }
  }

  SetNull();
  // Least significant byte is the last pair of digits
  size_t pos = str.size();
  for (int i = 0; i < WIDTH && pos > 0; ++i) {
    uint8_t byte = static_cast<uint8_t>(HexDigit(str[--pos]));
    if (pos > 0) {
      byte |= static_cast<uint8_t>(HexDigit(str[--pos]) << 4);
    }
    m_data[i] = byte;
  }
}

template class base_blob<256>;

std::optional<uint256> uint256::FromHex(std::string_view str) {
  if (str.size() != uint256::size() * 2) {
    return std::nullopt;
  }
  for (char c : str) {
    if (HexDigit(c) < 0) {
      return std::nullopt;
    }
  }
  uint256 result;
  result.SetHex(str);
  return result;
}

const uint256 uint256::ZERO(0);
const uint256 uint256::ONE(1);
