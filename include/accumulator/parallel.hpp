// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_ACCUMULATOR_PARALLEL_HPP
#define FOLDCHAIN_ACCUMULATOR_PARALLEL_HPP

#include "accumulator/reed_solomon.hpp"
#include "util/threadpool.hpp"
#include <span>
#include <vector>

namespace foldchain {
namespace accumulator {

/**
 * Parallel accumulation
 *
 * The digest sequence is split into contiguous slices, one partial state is
 * built per slice on the pool, and the partials are combined by a balanced
 * pairwise fold (log2(slices) rounds). Because Fold is associative and
 * commutative the result equals Accumulate(digests) exactly.
 *
 * Must not be called from a task running on `pool` (the caller blocks on
 * futures served by the same workers).
 */
AccumulatorState AccumulateParallel(std::span<const FieldElement> digests,
                                    util::ThreadPool &pool,
                                    size_t domain_size = DEFAULT_DOMAIN_SIZE,
                                    size_t min_slice = 16);

// Balanced pairwise fold of independent partial states. An empty input
// yields AccumulatorState::Empty(domain_size).
AccumulatorState FoldAll(std::vector<AccumulatorState> states,
                         util::ThreadPool &pool,
                         size_t domain_size = DEFAULT_DOMAIN_SIZE);

} // namespace accumulator
} // namespace foldchain

#endif // FOLDCHAIN_ACCUMULATOR_PARALLEL_HPP
