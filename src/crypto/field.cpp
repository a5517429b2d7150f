// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "crypto/field.hpp"
#include "util/endian.hpp"
#include <algorithm>

namespace foldchain {
namespace crypto {

FieldElement FieldElement::FromCanonical(uint64_t value) {
  if (value >= MODULUS) {
    throw FieldError(FieldError::Code::OutOfRange,
                     "field value " + std::to_string(value) +
                         " is not in canonical range");
  }
  return FromReduced(value);
}

FieldElement FieldElement::FromBytes(std::span<const uint8_t> data) noexcept {
  uint8_t buf[8] = {0};
  std::copy_n(data.begin(), std::min<size_t>(data.size(), sizeof(buf)), buf);
  return FieldElement(endian::ReadLE64(buf));
}

FieldElement FieldElement::FromHash(const uint256 &hash) noexcept {
  return FromBytes(std::span<const uint8_t>(hash.begin(), hash.size()));
}

FieldElement FieldElement::Pow(uint64_t exponent) const noexcept {
  FieldElement result = One();
  FieldElement base = *this;
  while (exponent > 0) {
    if (exponent & 1) {
      result *= base;
    }
    base *= base;
    exponent >>= 1;
  }
  return result;
}

FieldElement FieldElement::Inverse() const {
  if (IsZero()) {
    throw FieldError(FieldError::Code::ZeroInverse,
                     "multiplicative inverse of zero");
  }
  return Pow(MODULUS - 2);
}

void FieldElement::Serialize(uint8_t *out) const noexcept {
  endian::WriteLE32(out, value_);
}

FieldElement FieldElement::Deserialize(const uint8_t *in) {
  return FromCanonical(endian::ReadLE32(in));
}

} // namespace crypto
} // namespace foldchain
