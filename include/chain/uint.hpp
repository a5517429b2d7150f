// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_CHAIN_UINT_HPP
#define FOLDCHAIN_CHAIN_UINT_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace foldchain {

/**
 * Fixed-size opaque blob (hashes, identities)
 *
 * Bytes are stored in internal (little-endian) order, as produced by the
 * hash functions after reversal. GetHex() prints the most significant byte
 * first, Bitcoin-style.
 *
 * Ordering: Compare() orders blobs by their hex representation, i.e. from
 * the most significant byte down. Fork choice relies on this to break ties
 * by the lexicographically smallest identifier.
 */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0, "base_blob currently only supports whole bytes.");
  std::array<uint8_t, WIDTH> m_data;

public:
  constexpr base_blob() : m_data() {}

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  // Hex-order comparison (most significant byte first)
  constexpr int Compare(const base_blob &other) const {
    for (int i = WIDTH - 1; i >= 0; --i) {
      if (m_data[i] < other.m_data[i])
        return -1;
      if (m_data[i] > other.m_data[i])
        return 1;
    }
    return 0;
  }

  friend constexpr bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend constexpr bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend constexpr bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  std::string GetHex() const;
  // Accepts an optional 0x prefix; shorter strings are zero-extended
  void SetHex(const std::string &str);
  std::string ToString() const { return GetHex(); }

  constexpr const uint8_t *data() const { return m_data.data(); }
  constexpr uint8_t *data() { return m_data.data(); }

  constexpr uint8_t *begin() { return m_data.data(); }
  constexpr uint8_t *end() { return m_data.data() + WIDTH; }
  constexpr const uint8_t *begin() const { return m_data.data(); }
  constexpr const uint8_t *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }
};

/** 160-bit opaque blob (producer identities). */
class uint160 : public base_blob<160> {
public:
  constexpr uint160() = default;
};

/** 256-bit opaque blob (block identifiers, merkle roots). */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  static const uint256 ZERO;
};

// Parse a hex string into a uint256 (zero-extended)
uint256 uint256S(const std::string &str);

} // namespace foldchain

#endif // FOLDCHAIN_CHAIN_UINT_HPP
