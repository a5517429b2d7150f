// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_CRYPTO_MERKLE_HPP
#define FOLDCHAIN_CRYPTO_MERKLE_HPP

#include "chain/uint.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace foldchain {
namespace crypto {

/**
 * Binary Merkle tree over ordered payload records
 *
 * Hashing (SHA-256, domain separated so a leaf can never be replayed as an
 * interior node):
 *   leaf  = SHA256(0x00 || record)
 *   node  = SHA256(0x01 || left || right)
 *
 * Padding policy: a level with an odd number of nodes pairs its last node
 * with itself. Commit and verify apply the same rule.
 *
 * The root of an empty leaf set is the all-zero hash. The root of a single
 * leaf is that leaf's hash.
 *
 * Because of last-node duplication, [a, b, c] and [a, b, c, c] share a root.
 * ComputeMerkleRoot() reports such duplicated subtrees through `mutated` so
 * block checks can reject padded payloads.
 */

using MerkleLeaves = std::vector<std::vector<uint8_t>>;

// Sibling path from a leaf up to the root
struct MerkleProof {
  uint64_t index{0};
  std::vector<uint256> siblings;

  friend bool operator==(const MerkleProof &a, const MerkleProof &b) {
    return a.index == b.index && a.siblings == b.siblings;
  }
};

uint256 MerkleLeafHash(std::span<const uint8_t> record);
uint256 MerkleNodeHash(const uint256 &left, const uint256 &right);

// All levels are kept so proofs can be produced repeatedly without
// rehashing.
class MerkleTree {
public:
  explicit MerkleTree(const MerkleLeaves &leaves);

  [[nodiscard]] uint256 Root() const;
  [[nodiscard]] size_t LeafCount() const { return leaf_count_; }
  [[nodiscard]] bool IsMutated() const { return mutated_; }

  // Sibling path for leaf `index`; std::nullopt if out of range
  [[nodiscard]] std::optional<MerkleProof> Prove(size_t index) const;

private:
  size_t leaf_count_{0};
  bool mutated_{false};
  // levels_[0] = leaf hashes, levels_.back() = { root }
  std::vector<std::vector<uint256>> levels_;
};

uint256 ComputeMerkleRoot(const MerkleLeaves &leaves, bool *mutated = nullptr);

std::optional<MerkleProof> BuildMerkleProof(const MerkleLeaves &leaves,
                                            size_t index);

// Recompute the path from `record` and compare with `root`. Returns false on
// any mismatch (wrong record, wrong index, tampered sibling); never throws.
bool VerifyMerkleProof(const uint256 &root, std::span<const uint8_t> record,
                       const MerkleProof &proof) noexcept;

} // namespace crypto
} // namespace foldchain

#endif // FOLDCHAIN_CRYPTO_MERKLE_HPP
