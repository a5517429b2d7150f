// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_UTIL_ENDIAN_HPP
#define FOLDCHAIN_UTIL_ENDIAN_HPP

#include <cstdint>

namespace foldchain {
namespace endian {

// Byte-wise little-endian encoding, independent of host byte order.
// All consensus serialization goes through these helpers.

inline void WriteLE32(uint8_t *ptr, uint32_t x) {
  ptr[0] = static_cast<uint8_t>(x);
  ptr[1] = static_cast<uint8_t>(x >> 8);
  ptr[2] = static_cast<uint8_t>(x >> 16);
  ptr[3] = static_cast<uint8_t>(x >> 24);
}

inline void WriteLE64(uint8_t *ptr, uint64_t x) {
  WriteLE32(ptr, static_cast<uint32_t>(x));
  WriteLE32(ptr + 4, static_cast<uint32_t>(x >> 32));
}

inline uint32_t ReadLE32(const uint8_t *ptr) {
  return static_cast<uint32_t>(ptr[0]) |
         (static_cast<uint32_t>(ptr[1]) << 8) |
         (static_cast<uint32_t>(ptr[2]) << 16) |
         (static_cast<uint32_t>(ptr[3]) << 24);
}

inline uint64_t ReadLE64(const uint8_t *ptr) {
  return static_cast<uint64_t>(ReadLE32(ptr)) |
         (static_cast<uint64_t>(ReadLE32(ptr + 4)) << 32);
}

} // namespace endian
} // namespace foldchain

#endif // FOLDCHAIN_UTIL_ENDIAN_HPP
