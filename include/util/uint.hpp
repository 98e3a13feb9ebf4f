// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>

/** Template base class for fixed-sized opaque blobs. */
template <unsigned int BITS>
class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  std::array<uint8_t, WIDTH> m_data;
  static_assert(WIDTH == sizeof(m_data), "Sanity check");

public:
  /* construct 0 value by default */
  constexpr base_blob() : m_data() {}

  /* constructor for constants between 1 and 255 */
  constexpr explicit base_blob(uint8_t v) : m_data{v} {}

  constexpr explicit base_blob(std::span<const unsigned char> vch) : m_data() {
    std::copy(vch.begin(), vch.begin() + std::min<size_t>(vch.size(), WIDTH), m_data.begin());
  }

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(), [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  constexpr int Compare(const base_blob& other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend constexpr bool operator==(const base_blob& a, const base_blob& b) { return a.Compare(b) == 0; }
  friend constexpr bool operator!=(const base_blob& a, const base_blob& b) { return a.Compare(b) != 0; }
  friend constexpr bool operator<(const base_blob& a, const base_blob& b) { return a.Compare(b) < 0; }

  /** Hex string in display (byte-reversed) order, as Bitcoin prints hashes. */
  std::string GetHex() const;
  /** Parse display-order hex; non-hex input leaves the value unchanged. Short input is zero-extended. */
  void SetHex(std::string_view str);
  std::string ToString() const { return GetHex(); }

  constexpr const unsigned char* data() const { return m_data.data(); }
  constexpr unsigned char* data() { return m_data.data(); }

  constexpr unsigned char* begin() { return m_data.data(); }
  constexpr unsigned char* end() { return m_data.data() + WIDTH; }

  constexpr const unsigned char* begin() const { return m_data.data(); }
  constexpr const unsigned char* end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }

  constexpr uint64_t GetUint64(int pos) const {
    uint64_t x = 0;
    for (int i = 0; i < 8; ++i) {
      x |= static_cast<uint64_t>(m_data[pos * 8 + i]) << (8 * i);
    }
    return x;
  }
};

/** 256-bit opaque blob.
 * @note This type is called uint256 for historical reasons only. It is an
 * opaque blob of 256 bits and has no integer operations.
 */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(uint8_t v) : base_blob<256>(v) {}
  constexpr explicit uint256(std::span<const unsigned char> vch) : base_blob<256>(vch) {}

  /** Parse a 64-character display-order hex string; nullopt on any other input. */
  static std::optional<uint256> FromHex(std::string_view str);

  static const uint256 ZERO;
  static const uint256 ONE;
};

/** Hasher for unordered containers keyed by uint256 (hashes are already uniformly distributed). */
struct Uint256Hasher {
  size_t operator()(const uint256& hash) const { return static_cast<size_t>(hash.GetUint64(0)); }
};
