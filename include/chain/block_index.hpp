// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#pragma once

#include "accumulator/reed_solomon.hpp"
#include "chain/uint.hpp"
#include "crypto/field.hpp"
#include "primitives/block.hpp"
#include <cassert>
#include <cstdint>
#include <string>

namespace foldchain {
namespace chain {

/**
 * Validation progress and failure flags (nStatus)
 *
 * The low byte is a validity level (sequential, not bitflags); the failure
 * bits are independent flags.
 */
enum BlockStatus : uint32_t {
  BLOCK_VALID_UNKNOWN = 0,

  // Context-free checks passed (merkle root, accumulator domain)
  BLOCK_VALID_HEADER = 1,

  // Parent known, slot ordering and future-slot bound hold
  BLOCK_VALID_TREE = 2,

  // Accumulator state equals the parent state extended with this digest
  BLOCK_VALID_ACCUMULATOR = 3,

  BLOCK_FAILED_VALID = 32, //! Stage after last reached validity failed
  BLOCK_FAILED_CHILD = 64, //! Descends from failed block
  BLOCK_FAILED_MASK = BLOCK_FAILED_VALID | BLOCK_FAILED_CHILD,
};

static constexpr uint32_t VALIDITY_LEVEL_MASK = 0xFF;

/**
 * Block lifecycle
 *
 *   Pending -> Validated -> { Finalized | Orphaned }
 *
 * A block that fails validation after it was indexed goes straight to
 * Orphaned with a failure flag set in nStatus.
 */
enum class BlockState : uint8_t { Pending, Validated, Finalized, Orphaned };

const char *BlockStateToString(BlockState state);

/**
 * CBlockIndex - metadata for one known block
 *
 * Owned by BlockManager's map. Apart from the lifecycle state and the status
 * flags, every field is set once when the entry is created.
 */
class CBlockIndex {
public:
  uint32_t nStatus{0};

  BlockState state{BlockState::Pending};

  /**
   * Pointer to the block's hash (DOES NOT OWN).
   *
   * Points to the key of the BlockManager map entry, so BlockManager must
   * use a node-based container (std::map) for pointer stability.
   */
  const uint256 *phashBlock{nullptr};

  // Parent entry (DOES NOT OWN), nullptr for genesis
  CBlockIndex *pprev{nullptr};

  // Skip-list ancestor for O(log n) GetAncestor (DOES NOT OWN)
  CBlockIndex *pskip{nullptr};

  int nHeight{0};

  uint64_t nSlot{0};
  uint256 hashMerkleRoot{};
  uint160 producer{};

  // Accumulator state covering the chain up to and including this block
  accumulator::AccumulatorState accumulator;

  CBlockIndex() = default;

  explicit CBlockIndex(const CBlock &block)
      : nSlot{block.nSlot}, hashMerkleRoot{block.hashMerkleRoot},
        producer{block.producer}, accumulator{block.accumulator} {}

  [[nodiscard]] uint256 GetBlockHash() const noexcept {
    assert(phashBlock != nullptr);
    return *phashBlock;
  }

  [[nodiscard]] crypto::FieldElement GetDigest() const noexcept {
    return crypto::FieldElement::FromHash(GetBlockHash());
  }

  [[nodiscard]] CBlockHeader GetBlockHeader() const {
    CBlockHeader header;
    if (pprev)
      header.hashPrevBlock = pprev->GetBlockHash();
    header.nSlot = nSlot;
    header.hashMerkleRoot = hashMerkleRoot;
    header.producer = producer;
    return header;
  }

  // Set pskip; pprev and nHeight must be set first
  void BuildSkip();

  [[nodiscard]] const CBlockIndex *GetAncestor(int height) const;
  [[nodiscard]] CBlockIndex *GetAncestor(int height);

  [[nodiscard]] bool IsValid(
      enum BlockStatus nUpTo = BLOCK_VALID_ACCUMULATOR) const noexcept {
    assert(nUpTo <= BLOCK_VALID_ACCUMULATOR);
    if (nStatus & BLOCK_FAILED_MASK)
      return false;
    return ((nStatus & VALIDITY_LEVEL_MASK) >= nUpTo);
  }

  // Returns true if the level was raised
  bool RaiseValidity(enum BlockStatus nUpTo) noexcept {
    assert(nUpTo <= BLOCK_VALID_ACCUMULATOR);
    if (nStatus & BLOCK_FAILED_MASK)
      return false;

    if ((nStatus & VALIDITY_LEVEL_MASK) < nUpTo) {
      nStatus = (nStatus & ~VALIDITY_LEVEL_MASK) | nUpTo;
      return true;
    }
    return false;
  }

  [[nodiscard]] bool IsFinalized() const noexcept {
    return state == BlockState::Finalized;
  }
  [[nodiscard]] bool IsOrphaned() const noexcept {
    return state == BlockState::Orphaned;
  }

  [[nodiscard]] std::string ToString() const;

  // Entries are referenced by pointer from pprev/pskip and CChain, so they
  // never move or copy
  CBlockIndex(const CBlockIndex &) = delete;
  CBlockIndex &operator=(const CBlockIndex &) = delete;
  CBlockIndex(CBlockIndex &&) = delete;
  CBlockIndex &operator=(CBlockIndex &&) = delete;
};

// Fork point of two entries (nullptr if either is null or they share no
// ancestor)
[[nodiscard]] const CBlockIndex *LastCommonAncestor(const CBlockIndex *pa,
                                                    const CBlockIndex *pb);

} // namespace chain
} // namespace foldchain
