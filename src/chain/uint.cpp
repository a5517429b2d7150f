// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "chain/uint.hpp"

namespace foldchain {

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  static constexpr char hexmap[] = "0123456789abcdef";
  std::string out;
  out.reserve(WIDTH * 2);
  for (int i = WIDTH - 1; i >= 0; --i) {
    out.push_back(hexmap[m_data[i] >> 4]);
    out.push_back(hexmap[m_data[i] & 15]);
  }
  return out;
}

template <unsigned int BITS>
void base_blob<BITS>::SetHex(const std::string &str) {
  SetNull();

  size_t pos = 0;
  while (pos < str.size() && (str[pos] == ' ' || str[pos] == '\t'))
    ++pos;
  if (str.size() >= pos + 2 && str[pos] == '0' &&
      (str[pos + 1] == 'x' || str[pos + 1] == 'X'))
    pos += 2;

  // Find the end of the hex digits
  size_t digits_end = pos;
  while (digits_end < str.size() && HexDigit(str[digits_end]) != -1)
    ++digits_end;

  // Fill from the least significant nibble (end of the string)
  size_t byte_index = 0;
  size_t idx = digits_end;
  while (idx > pos && byte_index < static_cast<size_t>(WIDTH)) {
    uint8_t value = static_cast<uint8_t>(HexDigit(str[--idx]));
    if (idx > pos) {
      value |= static_cast<uint8_t>(HexDigit(str[--idx]) << 4);
    }
    m_data[byte_index++] = value;
  }
}

template class base_blob<160>;
template class base_blob<256>;

const uint256 uint256::ZERO{};

uint256 uint256S(const std::string &str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}

} // namespace foldchain
