// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "validation/chain_selector.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace foldchain {
namespace validation {

bool CBlockIndexHashComparator::operator()(const chain::CBlockIndex* pa, const chain::CBlockIndex* pb) const
{
    return pa->GetBlockHash().Compare(pb->GetBlockHash()) < 0;
}

bool ChainSelector::Qualifies(const chain::CBlockIndex* pindex, const chain::CBlockIndex* finalized)
{
    if (!pindex->IsValid() || pindex->IsOrphaned()) {
        return false;
    }
    if (finalized && pindex->GetAncestor(finalized->nHeight) != finalized) {
        return false;
    }
    return true;
}

chain::CBlockIndex* ChainSelector::FindBestChain(const consensus::DensityWindow& window,
                                                 const chain::CBlockIndex* finalized) const
{
    chain::CBlockIndex* best = nullptr;
    consensus::DensityScore best_score;
    size_t qualifying = 0;

    for (chain::CBlockIndex* pindex : m_candidates) {
        if (!Qualifies(pindex, finalized)) {
            continue;
        }
        ++qualifying;
        const consensus::DensityScore score = consensus::ScoreChain(pindex, window);
        if (!best || consensus::IsPreferredTip(pindex, score, best, best_score)) {
            best = pindex;
            best_score = score;
        }
    }

    if (best) {
        LOG_CONSENSUS_TRACE("FindBestChain: {} of {} candidates, best={} height={} density={}/{}",
                            qualifying, m_candidates.size(),
                            best->GetBlockHash().ToString().substr(0, 16),
                            best->nHeight, best_score.count, best_score.window_size);
    }
    return best;
}

std::vector<ChainSelector::ScoredTip> ChainSelector::ScoreCandidates(const consensus::DensityWindow& window,
                                                                     const chain::CBlockIndex* finalized) const
{
    std::vector<ScoredTip> scored;
    scored.reserve(m_candidates.size());
    for (chain::CBlockIndex* pindex : m_candidates) {
        if (Qualifies(pindex, finalized)) {
            scored.push_back({pindex, consensus::ScoreChain(pindex, window)});
        }
    }
    std::sort(scored.begin(), scored.end(), [](const ScoredTip& a, const ScoredTip& b) {
        return consensus::IsPreferredTip(a.tip, a.score, b.tip, b.score);
    });
    return scored;
}

void ChainSelector::TryAddBlockIndexCandidate(chain::CBlockIndex* pindex,
                                              const chain::BlockManager& block_manager)
{
    if (!pindex || !pindex->IsValid() || pindex->IsOrphaned()) {
        return;
    }

    // A block with a valid child is not a tip
    for (const auto& [hash, entry] : block_manager.GetBlockIndex()) {
        if (entry.pprev == pindex && entry.IsValid()) {
            return;
        }
    }

    if (pindex->pprev) {
        m_candidates.erase(pindex->pprev);
    }
    m_candidates.insert(pindex);

    LOG_CONSENSUS_TRACE("Candidate added: {} height={} (now {} candidates)",
                        pindex->GetBlockHash().ToString().substr(0, 16),
                        pindex->nHeight, m_candidates.size());
}

void ChainSelector::PruneBlockIndexCandidates(const chain::BlockManager& block_manager)
{
    for (auto it = m_candidates.begin(); it != m_candidates.end();) {
        chain::CBlockIndex* pindex = *it;
        bool has_valid_child = false;
        for (const auto& [hash, entry] : block_manager.GetBlockIndex()) {
            if (entry.pprev == pindex && entry.IsValid() && !entry.IsOrphaned()) {
                has_valid_child = true;
                break;
            }
        }
        if (!pindex->IsValid() || pindex->IsOrphaned() || has_valid_child) {
            it = m_candidates.erase(it);
        } else {
            ++it;
        }
    }
}

void ChainSelector::RemoveCandidate(chain::CBlockIndex* pindex)
{
    m_candidates.erase(pindex);
}

void ChainSelector::AddCandidateUnchecked(chain::CBlockIndex* pindex)
{
    m_candidates.insert(pindex);
}

void ChainSelector::ClearCandidates()
{
    m_candidates.clear();
}

} // namespace validation
} // namespace foldchain
