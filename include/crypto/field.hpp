// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_CRYPTO_FIELD_HPP
#define FOLDCHAIN_CRYPTO_FIELD_HPP

#include "chain/uint.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace foldchain {
namespace crypto {

// Mersenne prime 2^31 - 1
static constexpr uint64_t FIELD_PRIME = (uint64_t{1} << 31) - 1;

/**
 * Field arithmetic failure
 *
 * Raised only for caller errors: inverting zero, or decoding a value that
 * is not in canonical form. These are programming-invariant violations, not
 * recoverable conditions, so they propagate as exceptions.
 */
class FieldError : public std::logic_error {
public:
  enum class Code { ZeroInverse, OutOfRange };

  FieldError(Code code, const std::string &what)
      : std::logic_error(what), code_(code) {}

  Code code() const noexcept { return code_; }

private:
  Code code_;
};

/**
 * FieldElement - element of GF(p), p = 2^31 - 1
 *
 * Always held in canonical form [0, p). Every constructor and operator
 * reduces, so no operation can produce a non-canonical value.
 *
 * Pure value type, safe to use from any thread.
 */
class FieldElement {
public:
  static constexpr uint64_t MODULUS = FIELD_PRIME;
  static constexpr size_t SERIALIZED_SIZE = 4;

  constexpr FieldElement() noexcept : value_(0) {}
  constexpr explicit FieldElement(uint64_t value) noexcept
      : value_(static_cast<uint32_t>(Reduce(value))) {}

  // Strict constructor for decoded values: throws FieldError(OutOfRange)
  // if value >= p
  static FieldElement FromCanonical(uint64_t value);

  // Reduce the first 8 bytes (little-endian) of data; shorter input is
  // zero-extended
  static FieldElement FromBytes(std::span<const uint8_t> data) noexcept;

  // Field digest of a 256-bit hash (low 64 bits, reduced)
  static FieldElement FromHash(const uint256 &hash) noexcept;

  static constexpr FieldElement Zero() noexcept { return FieldElement(); }
  static constexpr FieldElement One() noexcept { return FieldElement(1); }

  [[nodiscard]] constexpr uint64_t Value() const noexcept { return value_; }
  [[nodiscard]] constexpr bool IsZero() const noexcept { return value_ == 0; }

  constexpr FieldElement operator+(const FieldElement &o) const noexcept {
    uint64_t sum = uint64_t{value_} + o.value_;
    return FromReduced(sum >= MODULUS ? sum - MODULUS : sum);
  }

  constexpr FieldElement operator-(const FieldElement &o) const noexcept {
    return FromReduced(value_ >= o.value_ ? uint64_t{value_} - o.value_
                                          : MODULUS - (o.value_ - value_));
  }

  constexpr FieldElement operator-() const noexcept {
    return FromReduced(value_ == 0 ? 0 : MODULUS - value_);
  }

  constexpr FieldElement operator*(const FieldElement &o) const noexcept {
    return FromReduced(Reduce(uint64_t{value_} * o.value_));
  }

  // Throws FieldError(ZeroInverse) when o is zero
  FieldElement operator/(const FieldElement &o) const {
    return *this * o.Inverse();
  }

  FieldElement &operator+=(const FieldElement &o) noexcept {
    return *this = *this + o;
  }
  FieldElement &operator-=(const FieldElement &o) noexcept {
    return *this = *this - o;
  }
  FieldElement &operator*=(const FieldElement &o) noexcept {
    return *this = *this * o;
  }

  friend constexpr bool operator==(const FieldElement &a,
                                   const FieldElement &b) noexcept {
    return a.value_ == b.value_;
  }
  friend constexpr bool operator!=(const FieldElement &a,
                                   const FieldElement &b) noexcept {
    return a.value_ != b.value_;
  }

  // Square-and-multiply, O(log exponent)
  [[nodiscard]] FieldElement Pow(uint64_t exponent) const noexcept;

  // Fermat inverse a^(p-2); throws FieldError(ZeroInverse) for zero
  [[nodiscard]] FieldElement Inverse() const;

  // 4 bytes little-endian
  void Serialize(uint8_t *out) const noexcept;
  // Throws FieldError(OutOfRange) for non-canonical encodings
  static FieldElement Deserialize(const uint8_t *in);

  std::string ToString() const { return std::to_string(value_); }

private:
  // Mersenne reduction: x mod (2^31 - 1) via x = (x & p) + (x >> 31)
  static constexpr uint64_t Reduce(uint64_t x) noexcept {
    x = (x & MODULUS) + (x >> 31);
    x = (x & MODULUS) + (x >> 31);
    return x >= MODULUS ? x - MODULUS : x;
  }

  static constexpr FieldElement FromReduced(uint64_t x) noexcept {
    FieldElement r;
    r.value_ = static_cast<uint32_t>(x);
    return r;
  }

  uint32_t value_;
};

} // namespace crypto
} // namespace foldchain

#endif // FOLDCHAIN_CRYPTO_FIELD_HPP
