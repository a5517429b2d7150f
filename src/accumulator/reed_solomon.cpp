// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "accumulator/reed_solomon.hpp"
#include "crypto/sha256.hpp"
#include "util/endian.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <sstream>

namespace foldchain {
namespace accumulator {

namespace {

constexpr size_t HEADER_SIZE = 8;

bool IsSupportedDomain(size_t domain_size) {
  return domain_size >= MIN_DOMAIN_SIZE && domain_size <= MAX_DOMAIN_SIZE &&
         domain_size % 2 == 0;
}

void CheckDomain(size_t domain_size) {
  if (!IsSupportedDomain(domain_size)) {
    throw std::invalid_argument("unsupported accumulator domain size " +
                                std::to_string(domain_size));
  }
}

FieldElement Factorial(size_t m) {
  FieldElement result = FieldElement::One();
  for (size_t i = 2; i <= m; ++i) {
    result *= FieldElement(i);
  }
  return result;
}

// In-place forward differences, `rounds` times. Entry j of the result is
// valid for j < values.size() - rounds.
void ForwardDifferences(std::vector<FieldElement> &values, size_t rounds) {
  const size_t len = values.size();
  for (size_t r = 1; r <= rounds; ++r) {
    for (size_t j = 0; j + r < len; ++j) {
      values[j] = values[j + 1] - values[j];
    }
  }
}

// prod_{d in digests} (x - d)
FieldElement VanishingAt(const FieldElement &x,
                         std::span<const FieldElement> digests) {
  FieldElement acc = FieldElement::One();
  for (const auto &d : digests) {
    acc *= (x - d);
  }
  return acc;
}

} // namespace

const char *ProofErrorCodeString(ProofError::Code code) {
  switch (code) {
  case ProofError::Code::DegreeExceeded:
    return "degree-exceeded";
  case ProofError::Code::MembershipFailed:
    return "membership-failed";
  case ProofError::Code::SizeMismatch:
    return "size-mismatch";
  }
  return "unknown";
}

// ----------------------------------------------------------------------------
// AccumulatorState
// ----------------------------------------------------------------------------

AccumulatorState AccumulatorState::Empty(size_t domain_size) {
  CheckDomain(domain_size);
  return AccumulatorState(
      0, std::vector<FieldElement>(domain_size, FieldElement::One()));
}

AccumulatorState AccumulatorState::Append(const FieldElement &digest) const {
  if (IsNull()) {
    throw ProofError(ProofError::Code::SizeMismatch,
                     "append to uninitialized accumulator");
  }
  if (IsFull()) {
    throw ProofError(ProofError::Code::DegreeExceeded,
                     "accumulator full: " + std::to_string(count_) + " of " +
                         std::to_string(DegreeBound()) + " digests");
  }

  std::vector<FieldElement> next(codeword_.size());
  for (size_t i = 0; i < codeword_.size(); ++i) {
    next[i] = codeword_[i] * (FieldElement(i) - digest);
  }
  return AccumulatorState(count_ + 1, std::move(next));
}

AccumulatorState AccumulatorState::Fold(const AccumulatorState &other) const {
  if (IsNull() || other.IsNull() || DomainSize() != other.DomainSize()) {
    throw ProofError(ProofError::Code::SizeMismatch,
                     "fold of domain " + std::to_string(DomainSize()) +
                         " with domain " + std::to_string(other.DomainSize()));
  }
  const uint64_t total = uint64_t{count_} + other.count_;
  if (total > DegreeBound()) {
    throw ProofError(ProofError::Code::DegreeExceeded,
                     "fold of " + std::to_string(count_) + " and " +
                         std::to_string(other.count_) +
                         " digests exceeds degree bound " +
                         std::to_string(DegreeBound()));
  }

  std::vector<FieldElement> product(codeword_.size());
  for (size_t i = 0; i < codeword_.size(); ++i) {
    product[i] = codeword_[i] * other.codeword_[i];
  }
  return AccumulatorState(static_cast<uint32_t>(total), std::move(product));
}

size_t AccumulatorState::SerializedSize() const noexcept {
  return HEADER_SIZE + codeword_.size() * FieldElement::SERIALIZED_SIZE;
}

void AccumulatorState::SerializeTo(std::vector<uint8_t> &out) const {
  const size_t offset = out.size();
  out.resize(offset + SerializedSize());
  uint8_t *ptr = out.data() + offset;
  endian::WriteLE32(ptr, static_cast<uint32_t>(codeword_.size()));
  endian::WriteLE32(ptr + 4, count_);
  ptr += HEADER_SIZE;
  for (const auto &value : codeword_) {
    value.Serialize(ptr);
    ptr += FieldElement::SERIALIZED_SIZE;
  }
}

std::vector<uint8_t> AccumulatorState::Serialize() const {
  std::vector<uint8_t> out;
  out.reserve(SerializedSize());
  SerializeTo(out);
  return out;
}

bool AccumulatorState::Deserialize(std::span<const uint8_t> data,
                                   AccumulatorState &out,
                                   size_t &consumed) noexcept {
  if (data.size() < HEADER_SIZE) {
    return false;
  }
  const uint32_t domain_size = endian::ReadLE32(data.data());
  const uint32_t count = endian::ReadLE32(data.data() + 4);
  if (!IsSupportedDomain(domain_size) || count > domain_size / 2) {
    return false;
  }

  const size_t total =
      HEADER_SIZE + size_t{domain_size} * FieldElement::SERIALIZED_SIZE;
  if (data.size() < total) {
    return false;
  }

  std::vector<FieldElement> codeword;
  codeword.reserve(domain_size);
  const uint8_t *ptr = data.data() + HEADER_SIZE;
  for (uint32_t i = 0; i < domain_size; ++i) {
    const uint32_t raw = endian::ReadLE32(ptr);
    if (raw >= FieldElement::MODULUS) {
      return false;
    }
    codeword.emplace_back(raw);
    ptr += FieldElement::SERIALIZED_SIZE;
  }

  out = AccumulatorState(count, std::move(codeword));
  consumed = total;
  return true;
}

uint256 AccumulatorState::GetCommitment() const {
  return crypto::Sha256(Serialize());
}

FieldElement AccumulatorState::GetCheckpointDigest() const {
  return FieldElement::FromHash(GetCommitment());
}

std::string AccumulatorState::ToString() const {
  std::ostringstream ss;
  ss << "AccumulatorState(N=" << DomainSize() << ", count=" << count_;
  if (!IsNull()) {
    ss << ", commitment=" << GetCommitment().GetHex().substr(0, 16);
  }
  ss << ")";
  return ss.str();
}

// ----------------------------------------------------------------------------
// Degree tests
// ----------------------------------------------------------------------------

bool IsMonicOfDegree(std::span<const FieldElement> evaluations,
                     size_t degree) noexcept {
  // Need at least two m-th differences to pin the leading coefficient
  if (degree + 1 >= evaluations.size()) {
    return false;
  }
  std::vector<FieldElement> diffs(evaluations.begin(), evaluations.end());
  ForwardDifferences(diffs, degree);
  const size_t remaining = diffs.size() - degree;
  const FieldElement expected = Factorial(degree);
  return std::all_of(diffs.begin(), diffs.begin() + remaining,
                     [&](const FieldElement &v) { return v == expected; });
}

bool IsWellFormed(const AccumulatorState &state) noexcept {
  if (state.IsNull() || state.Count() > state.DegreeBound()) {
    return false;
  }
  return IsMonicOfDegree(state.Codeword(), state.Count());
}

// ----------------------------------------------------------------------------
// Commit / prove / verify
// ----------------------------------------------------------------------------

AccumulatorState Accumulate(std::span<const FieldElement> digests,
                            size_t domain_size) {
  AccumulatorState state = AccumulatorState::Empty(domain_size);
  if (digests.size() > state.DegreeBound()) {
    throw ProofError(ProofError::Code::DegreeExceeded,
                     std::to_string(digests.size()) +
                         " digests exceed degree bound " +
                         std::to_string(state.DegreeBound()));
  }
  for (const auto &d : digests) {
    state = state.Append(d);
  }
  return state;
}

MembershipWitness Prove(std::span<const FieldElement> digests,
                        std::span<const FieldElement> members,
                        size_t domain_size) {
  CheckDomain(domain_size);
  if (digests.size() > domain_size / 2) {
    throw ProofError(ProofError::Code::DegreeExceeded,
                     std::to_string(digests.size()) +
                         " digests exceed degree bound " +
                         std::to_string(domain_size / 2));
  }

  // Multiset difference S \ R
  std::vector<FieldElement> remaining(digests.begin(), digests.end());
  for (const auto &member : members) {
    auto it = std::find(remaining.begin(), remaining.end(), member);
    if (it == remaining.end()) {
      throw ProofError(ProofError::Code::MembershipFailed,
                       "digest " + member.ToString() +
                           " is not committed by the accumulator");
    }
    remaining.erase(it);
  }

  MembershipWitness witness;
  witness.members.assign(members.begin(), members.end());
  witness.codeword.resize(domain_size);
  for (size_t i = 0; i < domain_size; ++i) {
    witness.codeword[i] = VanishingAt(FieldElement(i), remaining);
  }

  LOG_ACCUM_TRACE("Built witness for {} of {} digests (N={})", members.size(),
                  digests.size(), domain_size);
  return witness;
}

MembershipWitness ProveMember(std::span<const FieldElement> digests,
                              const FieldElement &member, size_t domain_size) {
  return Prove(digests, std::span<const FieldElement>(&member, 1), domain_size);
}

std::optional<ProofError::Code>
VerifyDetailed(const AccumulatorState &state, const FieldElement &digest,
               const MembershipWitness &witness) noexcept {
  const size_t n = state.Count();
  const size_t r = witness.members.size();

  // 1. Sizes
  if (state.IsNull() || witness.codeword.size() != state.DomainSize()) {
    return ProofError::Code::SizeMismatch;
  }

  // 2. State is the codeword of a monic degree-n polynomial, n <= k
  if (!IsWellFormed(state)) {
    return ProofError::Code::DegreeExceeded;
  }

  // The digest must be among the claimed members, and the claim cannot
  // exceed the committed count
  if (r > n || std::find(witness.members.begin(), witness.members.end(),
                         digest) == witness.members.end()) {
    return ProofError::Code::MembershipFailed;
  }

  // 3. Witness is monic of degree n - |R|
  if (!IsMonicOfDegree(witness.codeword, n - r)) {
    return ProofError::Code::DegreeExceeded;
  }

  // 4. W * V_R == C on every domain point
  const auto &codeword = state.Codeword();
  for (size_t i = 0; i < codeword.size(); ++i) {
    const FieldElement x(i);
    if (witness.codeword[i] * VanishingAt(x, witness.members) != codeword[i]) {
      return ProofError::Code::MembershipFailed;
    }
  }
  return std::nullopt;
}

bool Verify(const AccumulatorState &state, const FieldElement &digest,
            const MembershipWitness &witness) noexcept {
  const auto failure = VerifyDetailed(state, digest, witness);
  if (failure) {
    LOG_ACCUM_DEBUG("Membership check for digest {} failed: {}",
                    digest.ToString(), ProofErrorCodeString(*failure));
    return false;
  }
  return true;
}

bool VerifyProof(const AccumulatorProof &proof,
                 const FieldElement &digest) noexcept {
  return Verify(proof.state, digest, proof.witness);
}

} // namespace accumulator
} // namespace foldchain
