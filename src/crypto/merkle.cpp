// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "crypto/merkle.hpp"
#include "crypto/sha256.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <exception>

namespace foldchain {
namespace crypto {

namespace {

constexpr uint8_t LEAF_PREFIX = 0x00;
constexpr uint8_t NODE_PREFIX = 0x01;

uint256 FromDigest(const uint8_t digest[CSHA256::OUTPUT_SIZE]) {
  uint256 out;
  std::copy(digest, digest + CSHA256::OUTPUT_SIZE, out.begin());
  return out;
}

} // namespace

uint256 MerkleLeafHash(std::span<const uint8_t> record) {
  uint8_t digest[CSHA256::OUTPUT_SIZE];
  CSHA256().Write(&LEAF_PREFIX, 1).Write(record).Finalize(digest);
  return FromDigest(digest);
}

uint256 MerkleNodeHash(const uint256 &left, const uint256 &right) {
  uint8_t digest[CSHA256::OUTPUT_SIZE];
  CSHA256()
      .Write(&NODE_PREFIX, 1)
      .Write(left.data(), left.size())
      .Write(right.data(), right.size())
      .Finalize(digest);
  return FromDigest(digest);
}

MerkleTree::MerkleTree(const MerkleLeaves &leaves) : leaf_count_(leaves.size()) {
  if (leaves.empty()) {
    return;
  }

  std::vector<uint256> level;
  level.reserve(leaves.size());
  for (const auto &leaf : leaves) {
    level.push_back(MerkleLeafHash(leaf));
  }
  levels_.push_back(std::move(level));

  while (levels_.back().size() > 1) {
    const auto &below = levels_.back();
    std::vector<uint256> above;
    above.reserve((below.size() + 1) / 2);
    for (size_t i = 0; i < below.size(); i += 2) {
      // Odd count: pair the last node with itself
      const uint256 &left = below[i];
      const uint256 &right = (i + 1 < below.size()) ? below[i + 1] : below[i];
      if (i + 1 < below.size() && left == right) {
        mutated_ = true;
      }
      above.push_back(MerkleNodeHash(left, right));
    }
    levels_.push_back(std::move(above));
  }
}

uint256 MerkleTree::Root() const {
  if (levels_.empty()) {
    return uint256::ZERO;
  }
  return levels_.back().front();
}

std::optional<MerkleProof> MerkleTree::Prove(size_t index) const {
  if (index >= leaf_count_) {
    return std::nullopt;
  }

  MerkleProof proof;
  proof.index = index;
  size_t pos = index;
  for (size_t depth = 0; depth + 1 < levels_.size(); ++depth) {
    const auto &level = levels_[depth];
    size_t sibling = (pos % 2 == 0) ? pos + 1 : pos - 1;
    if (sibling >= level.size()) {
      sibling = pos; // duplicated last node
    }
    proof.siblings.push_back(level[sibling]);
    pos /= 2;
  }
  return proof;
}

uint256 ComputeMerkleRoot(const MerkleLeaves &leaves, bool *mutated) {
  MerkleTree tree(leaves);
  if (mutated) {
    *mutated = tree.IsMutated();
  }
  return tree.Root();
}

std::optional<MerkleProof> BuildMerkleProof(const MerkleLeaves &leaves,
                                            size_t index) {
  return MerkleTree(leaves).Prove(index);
}

bool VerifyMerkleProof(const uint256 &root, std::span<const uint8_t> record,
                       const MerkleProof &proof) noexcept {
  // A path of depth d addresses at most 2^d leaves
  if (proof.siblings.size() < 64 &&
      (proof.index >> proof.siblings.size()) != 0) {
    return false;
  }

  try {
    uint256 current = MerkleLeafHash(record);
    uint64_t index = proof.index;
    for (const auto &sibling : proof.siblings) {
      current = (index % 2 == 0) ? MerkleNodeHash(current, sibling)
                                 : MerkleNodeHash(sibling, current);
      index >>= 1;
    }
    return current == root;
  } catch (const std::exception &e) {
    LOG_CRYPTO_ERROR("Merkle proof verification aborted: {}", e.what());
    return false;
  }
}

} // namespace crypto
} // namespace foldchain
