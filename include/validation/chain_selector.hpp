// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_VALIDATION_CHAIN_SELECTOR_HPP
#define FOLDCHAIN_VALIDATION_CHAIN_SELECTOR_HPP

#include "chain/block_index.hpp"
#include "chain/block_manager.hpp"
#include "consensus/density.hpp"
#include <set>
#include <vector>

namespace foldchain {
namespace validation {

/**
 * Orders candidates by block identifier (hex order)
 *
 * Only the identifier is used: it never changes, unlike densities, which
 * move with the window. Iteration order is therefore the same on every node.
 */
struct CBlockIndexHashComparator {
    bool operator()(const chain::CBlockIndex* pa, const chain::CBlockIndex* pb) const;
};

/**
 * ChainSelector - Manages candidate tips and selects the canonical head
 *
 * The candidate set contains the leaves of the valid block tree: blocks
 * validated up to BLOCK_VALID_ACCUMULATOR with no valid child. The active
 * tip stays a candidate, because a later window can rank it below a fork.
 *
 * Densities depend on the current slot, so selection scores every candidate
 * against one shared window instead of keeping the set sorted by score.
 *
 * THREAD SAFETY:
 * ChainSelector does NOT have its own mutex. The caller (ChainstateManager)
 * must hold validation_mutex_ when calling any ChainSelector methods.
 */
class ChainSelector
{
public:
    struct ScoredTip {
        chain::CBlockIndex* tip;
        consensus::DensityScore score;
    };

    ChainSelector() = default;

    /**
     * Best candidate under the fork-choice order (density, height, identifier)
     *
     * Candidates that are orphaned, failed, or do not descend from `finalized`
     * are skipped.
     *
     * @return Preferred tip, or nullptr if no candidate qualifies
     */
    chain::CBlockIndex* FindBestChain(const consensus::DensityWindow& window,
                                      const chain::CBlockIndex* finalized) const;

    // Every qualifying candidate with its score, preferred first
    std::vector<ScoredTip> ScoreCandidates(const consensus::DensityWindow& window,
                                           const chain::CBlockIndex* finalized) const;

    /**
     * Add a newly validated block; its parent stops being a leaf
     *
     * Example:
     *   Initial: candidates = {A}
     *   Add B extending A: candidates = {B}  (A removed)
     *   Add D extending A: candidates = {B, D}  (fork from A)
     */
    void TryAddBlockIndexCandidate(chain::CBlockIndex* pindex, const chain::BlockManager& block_manager);

    // Drop failed, orphaned and non-leaf candidates
    void PruneBlockIndexCandidates(const chain::BlockManager& block_manager);

    void RemoveCandidate(chain::CBlockIndex* pindex);

    // Used during Load
    void AddCandidateUnchecked(chain::CBlockIndex* pindex);
    void ClearCandidates();

    size_t GetCandidateCount() const { return m_candidates.size(); }

    bool IsCandidate(chain::CBlockIndex* pindex) const
    {
        return m_candidates.count(pindex) > 0;
    }

private:
    static bool Qualifies(const chain::CBlockIndex* pindex, const chain::CBlockIndex* finalized);

    std::set<chain::CBlockIndex*, CBlockIndexHashComparator> m_candidates;
};

} // namespace validation
} // namespace foldchain

#endif // FOLDCHAIN_VALIDATION_CHAIN_SELECTOR_HPP
