// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "chain/block_index.hpp"
#include <sstream>

namespace foldchain {
namespace chain {

namespace {

// Turn the lowest '1' bit in the binary representation of a number into a '0'.
int InvertLowestOne(int n) { return n & (n - 1); }

// Compute what height to jump back to with the CBlockIndex::pskip pointer.
int GetSkipHeight(int height) {
  if (height < 2)
    return 0;

  // Determine which height to jump back to. Any number strictly lower than
  // height is acceptable, but the following expression seems to perform well
  // in simulations (max 110 steps to go back up to 2**18 blocks).
  return (height & 1) ? InvertLowestOne(InvertLowestOne(height - 1)) + 1
                      : InvertLowestOne(height);
}

} // namespace

const char *BlockStateToString(BlockState state) {
  switch (state) {
  case BlockState::Pending:
    return "pending";
  case BlockState::Validated:
    return "validated";
  case BlockState::Finalized:
    return "finalized";
  case BlockState::Orphaned:
    return "orphaned";
  }
  return "unknown";
}

void CBlockIndex::BuildSkip() {
  if (pprev)
    pskip = pprev->GetAncestor(GetSkipHeight(nHeight));
}

const CBlockIndex *CBlockIndex::GetAncestor(int height) const {
  if (height > nHeight || height < 0)
    return nullptr;

  const CBlockIndex *pindexWalk = this;
  int heightWalk = nHeight;
  while (heightWalk > height) {
    int heightSkip = GetSkipHeight(heightWalk);
    int heightSkipPrev = GetSkipHeight(heightWalk - 1);
    if (pindexWalk->pskip != nullptr &&
        (heightSkip == height ||
         (heightSkip > height && !(heightSkipPrev < heightSkip - 2 &&
                                   heightSkipPrev >= height)))) {
      // Only follow pskip if pprev->pskip isn't better than pskip->pprev.
      pindexWalk = pindexWalk->pskip;
      heightWalk = heightSkip;
    } else {
      assert(pindexWalk->pprev);
      pindexWalk = pindexWalk->pprev;
      heightWalk--;
    }
  }
  return pindexWalk;
}

CBlockIndex *CBlockIndex::GetAncestor(int height) {
  return const_cast<CBlockIndex *>(
      static_cast<const CBlockIndex *>(this)->GetAncestor(height));
}

std::string CBlockIndex::ToString() const {
  std::ostringstream ss;
  ss << "CBlockIndex("
     << "hash=" << (phashBlock ? phashBlock->ToString().substr(0, 16) : "null")
     << ", height=" << nHeight << ", slot=" << nSlot
     << ", state=" << BlockStateToString(state) << ", status=0x" << std::hex
     << nStatus << std::dec
     << ", merkle=" << hashMerkleRoot.ToString().substr(0, 16)
     << ", producer=" << producer.ToString()
     << ", digests=" << accumulator.Count() << ", pprev=" << pprev << ")";
  return ss.str();
}

const CBlockIndex *LastCommonAncestor(const CBlockIndex *pa,
                                      const CBlockIndex *pb) {
  if (pa == nullptr || pb == nullptr) {
    return nullptr;
  }

  if (pa->nHeight > pb->nHeight) {
    pa = pa->GetAncestor(pb->nHeight);
  } else if (pb->nHeight > pa->nHeight) {
    pb = pb->GetAncestor(pa->nHeight);
  }

  while (pa != pb && pa && pb) {
    pa = pa->pprev;
    pb = pb->pprev;
  }

  return pa;
}

} // namespace chain
} // namespace foldchain
