// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_CONSENSUS_DENSITY_HPP
#define FOLDCHAIN_CONSENSUS_DENSITY_HPP

#include <cstdint>

namespace foldchain {

namespace chain {
class CBlockIndex;
class CChain;
} // namespace chain

namespace consensus {

/**
 * DensityWindow - trailing window of W slots, (end_slot - W, end_slot]
 *
 * end_slot is the current slot of the local slot clock. Blocks produced for
 * future slots (allowed up to nMaxFutureSlots ahead) only start counting once
 * the clock reaches them.
 */
struct DensityWindow {
  uint64_t end_slot{0};
  uint64_t size{1};

  bool Contains(uint64_t slot) const noexcept {
    return slot <= end_slot && slot + size > end_slot;
  }

  // Lowest slot inside the window
  uint64_t FirstSlot() const noexcept {
    return end_slot + 1 >= size ? end_slot + 1 - size : 0;
  }
};

DensityWindow MakeWindow(uint64_t current_slot, uint64_t window_size);

/**
 * DensityScore - density of one chain
 *
 * Stored as an integer block count over the window size. All chains in one
 * fork-choice round share the window, so counts compare exactly.
 */
struct DensityScore {
  uint64_t count{0};
  uint64_t window_size{1};

  double Value() const noexcept {
    return static_cast<double>(count) / static_cast<double>(window_size);
  }
};

// Validated/Finalized blocks of the chain ending at `tip` whose slot lies in
// the window
uint64_t CountBlocksInWindow(const chain::CBlockIndex *tip,
                             const DensityWindow &window);

// Same, for an active chain (binary search on slots)
uint64_t CountBlocksInWindow(const chain::CChain &chain,
                             const DensityWindow &window);

DensityScore ScoreChain(const chain::CBlockIndex *tip,
                        const DensityWindow &window);

/**
 * Fork-choice order: true if tip `a` is preferred over tip `b`
 *
 * 1. higher density (block count in the shared window)
 * 2. greater height
 * 3. lexicographically smaller block identifier (hex order)
 *
 * A strict total order on distinct blocks, so every node holding the same
 * block set picks the same head.
 */
bool IsPreferredTip(const chain::CBlockIndex *a, const DensityScore &da,
                    const chain::CBlockIndex *b, const DensityScore &db);

} // namespace consensus
} // namespace foldchain

#endif // FOLDCHAIN_CONSENSUS_DENSITY_HPP
