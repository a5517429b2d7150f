// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "chain/chain.hpp"
#include <algorithm>

namespace foldchain {
namespace chain {

void CChain::SetTip(CBlockIndex& block)
{
    CBlockIndex* pindex = &block;
    vChain.resize(pindex->nHeight + 1);

    // Walk backwards from tip, filling in the vector
    while (pindex && vChain[pindex->nHeight] != pindex) {
        vChain[pindex->nHeight] = pindex;
        pindex = pindex->pprev;
    }
}

const CBlockIndex* CChain::FindFork(const CBlockIndex* pindex) const
{
    if (pindex == nullptr) {
        return nullptr;
    }

    if (pindex->nHeight > Height())
        pindex = pindex->GetAncestor(Height());

    while (pindex && !Contains(pindex))
        pindex = pindex->pprev;

    return pindex;
}

CBlockIndex* CChain::FindEarliestAtSlot(uint64_t nSlot) const
{
    auto lower = std::lower_bound(vChain.begin(), vChain.end(), nSlot,
                                  [](const CBlockIndex* pBlock, uint64_t slot) {
                                      return pBlock->nSlot < slot;
                                  });

    return (lower == vChain.end() ? nullptr : *lower);
}

} // namespace chain
} // namespace foldchain
