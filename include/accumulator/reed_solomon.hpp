// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_ACCUMULATOR_REED_SOLOMON_HPP
#define FOLDCHAIN_ACCUMULATOR_REED_SOLOMON_HPP

#include "chain/uint.hpp"
#include "crypto/field.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace foldchain {
namespace accumulator {

using crypto::FieldElement;

/**
 * ============================================================================
 * REED-SOLOMON DIGEST ACCUMULATOR
 * ============================================================================
 *
 * A committed multiset S of field digests is represented by the vanishing
 * polynomial
 *
 *     Z_S(X) = prod_{d in S} (X - d)
 *
 * stored as its Reed-Solomon codeword: the evaluations of Z_S on the fixed
 * domain x_i = i, i in [0, N). N is the domain size; the degree bound
 * (security parameter) is k = N / 2, so a state commits at most k digests and
 * every codeword carries at least N - k redundant evaluations.
 *
 * OPERATIONS
 * - Append(d):   C_i <- C_i * (x_i - d)                       O(N)
 * - Fold(a, b):  C_i <- a_i * b_i  (codeword of Z_{Sa + Sb})   O(N)
 *   Pointwise products are associative and commutative, and the empty state
 *   (all ones) is the identity, so partial states built by independent
 *   workers can be folded in any order.
 *
 * MEMBERSHIP
 * A witness for a claimed member set R is the codeword W of
 * Q(X) = Z_S(X) / prod_{r in R}(X - r). Verification checks:
 *   1. N matches between state and witness              (SizeMismatch)
 *   2. C is a monic polynomial of degree exactly n <= k   (DegreeExceeded)
 *   3. W is a monic polynomial of degree n - |R|          (DegreeExceeded)
 *   4. W_i * prod_{r in R}(x_i - r) == C_i for all i       (MembershipFailed)
 * Both sides of (4) have degree <= n < N and agree on N points, so they are
 * the same polynomial and every r in R is a root of Z_S. A forged witness
 * W_i = C_i / (x_i - r) for a non-member r satisfies (4) pointwise but is not
 * low-degree, so (3) rejects it.
 *
 * Degree tests use finite differences over the consecutive-integer domain:
 * a codeword has degree <= m iff its (m+1)-th forward differences vanish,
 * and a monic degree-m polynomial has constant m-th difference m!.
 *
 * COST TRADE-OFF
 * State and witness size are constant (N field elements) regardless of how
 * many digests were committed. Producing a witness is O(N * n): it is
 * recomputed from the raw digests, which the prover must keep. Verification
 * is O(N * n) field subtractions.
 * ============================================================================
 */

static constexpr size_t DEFAULT_DOMAIN_SIZE = 256;
static constexpr size_t MIN_DOMAIN_SIZE = 4;
static constexpr size_t MAX_DOMAIN_SIZE = 1 << 16;

/**
 * Accumulator failure raised by construction operations (Append, Fold,
 * Prove). Verification never throws; it reports false, or the code via
 * VerifyDetailed().
 */
class ProofError : public std::runtime_error {
public:
  enum class Code { DegreeExceeded, MembershipFailed, SizeMismatch };

  ProofError(Code code, const std::string &what)
      : std::runtime_error(what), code_(code) {}

  Code code() const noexcept { return code_; }

private:
  Code code_;
};

const char *ProofErrorCodeString(ProofError::Code code);

/**
 * AccumulatorState - constant-size commitment to a multiset of digests
 *
 * Immutable: Append() and Fold() return new states, so older states stay
 * valid for anyone still holding them (point-in-time proofs).
 *
 * A default-constructed state is null (domain size 0) and only used as a
 * placeholder before deserialization.
 */
class AccumulatorState {
public:
  AccumulatorState() = default;

  // Empty commitment; throws std::invalid_argument for an unsupported domain
  // size (odd, below MIN_DOMAIN_SIZE or above MAX_DOMAIN_SIZE)
  static AccumulatorState Empty(size_t domain_size = DEFAULT_DOMAIN_SIZE);

  [[nodiscard]] bool IsNull() const noexcept { return codeword_.empty(); }
  [[nodiscard]] size_t DomainSize() const noexcept { return codeword_.size(); }
  [[nodiscard]] size_t DegreeBound() const noexcept { return DomainSize() / 2; }
  [[nodiscard]] uint32_t Count() const noexcept { return count_; }
  [[nodiscard]] bool IsFull() const noexcept { return count_ >= DegreeBound(); }

  const std::vector<FieldElement> &Codeword() const noexcept {
    return codeword_;
  }

  // Throws ProofError(DegreeExceeded) when the state is full
  [[nodiscard]] AccumulatorState Append(const FieldElement &digest) const;

  // Throws ProofError(SizeMismatch) for different domain sizes and
  // ProofError(DegreeExceeded) when the union exceeds the degree bound
  [[nodiscard]] AccumulatorState Fold(const AccumulatorState &other) const;

  // Wire format: u32 domain size | u32 count | N * u32 evaluations (LE)
  [[nodiscard]] size_t SerializedSize() const noexcept;
  [[nodiscard]] std::vector<uint8_t> Serialize() const;
  void SerializeTo(std::vector<uint8_t> &out) const;

  // Decodes one state from the front of `data`. Returns false for truncated
  // input, an unsupported domain size or a non-canonical evaluation.
  [[nodiscard]] static bool Deserialize(std::span<const uint8_t> data,
                                        AccumulatorState &out,
                                        size_t &consumed) noexcept;

  // SHA-256 of the serialization
  [[nodiscard]] uint256 GetCommitment() const;

  // Field digest of the commitment, carried into the next epoch
  [[nodiscard]] FieldElement GetCheckpointDigest() const;

  std::string ToString() const;

  friend bool operator==(const AccumulatorState &a, const AccumulatorState &b) {
    return a.count_ == b.count_ && a.codeword_ == b.codeword_;
  }
  friend bool operator!=(const AccumulatorState &a, const AccumulatorState &b) {
    return !(a == b);
  }

private:
  AccumulatorState(uint32_t count, std::vector<FieldElement> codeword)
      : count_(count), codeword_(std::move(codeword)) {}

  uint32_t count_{0};
  std::vector<FieldElement> codeword_;
};

// Codeword of Z_S / prod_{r in R}(X - r) together with the claimed set R
struct MembershipWitness {
  std::vector<FieldElement> members;
  std::vector<FieldElement> codeword;
};

/**
 * Witness bound to the state it verifies against
 *
 * `anchor` names the block whose accumulator is `state` and
 * [first_height, last_height] the heights whose digests form the member set.
 * Free-standing proofs (not tied to a chain) leave the anchor null and the
 * heights at -1.
 */
struct AccumulatorProof {
  AccumulatorState state;
  MembershipWitness witness;
  uint256 anchor;
  int first_height{-1};
  int last_height{-1};
};

// Commit a digest sequence from the empty state
AccumulatorState Accumulate(std::span<const FieldElement> digests,
                            size_t domain_size = DEFAULT_DOMAIN_SIZE);

/**
 * Build the witness for `members` (a sub-multiset of `digests`)
 *
 * Throws ProofError(MembershipFailed) if a member is not among the digests,
 * ProofError(DegreeExceeded) if `digests` exceeds the degree bound.
 */
MembershipWitness Prove(std::span<const FieldElement> digests,
                        std::span<const FieldElement> members,
                        size_t domain_size = DEFAULT_DOMAIN_SIZE);

MembershipWitness ProveMember(std::span<const FieldElement> digests,
                              const FieldElement &member,
                              size_t domain_size = DEFAULT_DOMAIN_SIZE);

// std::nullopt when `digest` is a proven member of `state`, otherwise the
// reason for rejection
std::optional<ProofError::Code>
VerifyDetailed(const AccumulatorState &state, const FieldElement &digest,
               const MembershipWitness &witness) noexcept;

bool Verify(const AccumulatorState &state, const FieldElement &digest,
            const MembershipWitness &witness) noexcept;

bool VerifyProof(const AccumulatorProof &proof,
                 const FieldElement &digest) noexcept;

// True if `evaluations` interpolate to a monic polynomial of degree exactly
// `degree`. Requires degree < evaluations.size() - 1 to be meaningful.
bool IsMonicOfDegree(std::span<const FieldElement> evaluations,
                     size_t degree) noexcept;

// State codeword is monic of degree Count() and Count() <= DegreeBound()
bool IsWellFormed(const AccumulatorState &state) noexcept;

} // namespace accumulator
} // namespace foldchain

#endif // FOLDCHAIN_ACCUMULATOR_REED_SOLOMON_HPP
