// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_CHAIN_CHAIN_HPP
#define FOLDCHAIN_CHAIN_CHAIN_HPP

#include "chain/block_index.hpp"
#include <cstdint>
#include <vector>

namespace foldchain {
namespace chain {

/**
 * CChain - An in-memory indexed chain of blocks
 *
 * Represents a single linear chain as a vector of CBlockIndex pointers,
 * indexed by height. Used for the active (canonical) chain.
 *
 * Does NOT own the CBlockIndex objects.
 */
class CChain {
private:
    std::vector<CBlockIndex*> vChain;

public:
    CChain() = default;

    CChain(const CChain&) = delete;
    CChain& operator=(const CChain&) = delete;

    CBlockIndex* Genesis() const
    {
        return vChain.size() > 0 ? vChain[0] : nullptr;
    }

    CBlockIndex* Tip() const
    {
        return vChain.size() > 0 ? vChain[vChain.size() - 1] : nullptr;
    }

    // nullptr if no such height exists
    CBlockIndex* operator[](int nHeight) const
    {
        if (nHeight < 0 || nHeight >= (int)vChain.size())
            return nullptr;
        return vChain[nHeight];
    }

    bool Contains(const CBlockIndex* pindex) const
    {
        if (!pindex) return false;
        if (pindex->nHeight < 0 || pindex->nHeight >= (int)vChain.size()) {
            return false;
        }
        return vChain[pindex->nHeight] == pindex;
    }

    // Successor of a block in this chain, or nullptr if not found or tip
    CBlockIndex* Next(const CBlockIndex* pindex) const
    {
        if (Contains(pindex))
            return (*this)[pindex->nHeight + 1];
        else
            return nullptr;
    }

    // Tip height, -1 when empty
    int Height() const
    {
        return int(vChain.size()) - 1;
    }

    // Walks backwards from the tip using pprev to populate the vector
    void SetTip(CBlockIndex& block);

    void Clear() { vChain.clear(); }

    // Last block of this chain that is also an ancestor of pindex
    const CBlockIndex* FindFork(const CBlockIndex* pindex) const;

    // Earliest block with slot >= nSlot (slots strictly increase along the
    // chain), nullptr if none
    CBlockIndex* FindEarliestAtSlot(uint64_t nSlot) const;
};

} // namespace chain
} // namespace foldchain

#endif // FOLDCHAIN_CHAIN_CHAIN_HPP
