// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_ACCUMULATOR_EPOCH_HPP
#define FOLDCHAIN_ACCUMULATOR_EPOCH_HPP

#include "accumulator/reed_solomon.hpp"
#include <cstddef>

namespace foldchain {
namespace accumulator {

/**
 * Chain epochs
 *
 * A state holds at most k = N/2 digests, so the chain commits in epochs of
 * k - 1 blocks. Epoch 0 starts at genesis from the empty state. Every later
 * epoch starts from Empty(N).Append(checkpoint), where the checkpoint is the
 * field digest of the previous epoch's final state. Each state thus commits
 * its own epoch directly and all earlier history through the checkpoint
 * chain, at constant size.
 */

// Blocks per epoch for domain size N (k - 1)
[[nodiscard]] int EpochLength(size_t domain_size);

[[nodiscard]] int EpochOf(int height, size_t domain_size);

// Height of the first block of the epoch containing `height`
[[nodiscard]] int EpochStartHeight(int height, size_t domain_size);

// Height of the last block of the epoch containing `height`
[[nodiscard]] int EpochEndHeight(int height, size_t domain_size);

/**
 * State of a block at `height` with digest `digest`, given its parent's state
 * (ignored for genesis, height 0). Throws ProofError when the parent state
 * cannot be extended.
 */
AccumulatorState NextAccumulatorState(const AccumulatorState &parent_state,
                                      int height, const FieldElement &digest,
                                      size_t domain_size);

} // namespace accumulator
} // namespace foldchain

#endif // FOLDCHAIN_ACCUMULATOR_EPOCH_HPP
