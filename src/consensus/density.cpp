// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "consensus/density.hpp"
#include "chain/block_index.hpp"
#include "chain/chain.hpp"
#include <stdexcept>

namespace foldchain {
namespace consensus {

namespace {

bool CountsTowardDensity(const chain::CBlockIndex *pindex) {
  return pindex->IsValid() &&
         (pindex->state == chain::BlockState::Validated ||
          pindex->state == chain::BlockState::Finalized);
}

} // namespace

DensityWindow MakeWindow(uint64_t current_slot, uint64_t window_size) {
  if (window_size == 0) {
    throw std::invalid_argument("density window must be at least one slot");
  }
  return DensityWindow{current_slot, window_size};
}

uint64_t CountBlocksInWindow(const chain::CBlockIndex *tip,
                             const DensityWindow &window) {
  uint64_t count = 0;
  const uint64_t first = window.FirstSlot();
  // Slots strictly decrease walking back, so stop at the window's start
  for (const chain::CBlockIndex *pindex = tip; pindex && pindex->nSlot >= first;
       pindex = pindex->pprev) {
    if (pindex->nSlot <= window.end_slot && CountsTowardDensity(pindex)) {
      ++count;
    }
  }
  return count;
}

uint64_t CountBlocksInWindow(const chain::CChain &chain,
                             const DensityWindow &window) {
  const chain::CBlockIndex *first = chain.FindEarliestAtSlot(window.FirstSlot());
  if (!first) {
    return 0;
  }
  const chain::CBlockIndex *past_end =
      chain.FindEarliestAtSlot(window.end_slot + 1);
  const int end_height = past_end ? past_end->nHeight : chain.Height() + 1;
  return end_height > first->nHeight
             ? static_cast<uint64_t>(end_height - first->nHeight)
             : 0;
}

DensityScore ScoreChain(const chain::CBlockIndex *tip,
                        const DensityWindow &window) {
  return DensityScore{CountBlocksInWindow(tip, window), window.size};
}

bool IsPreferredTip(const chain::CBlockIndex *a, const DensityScore &da,
                    const chain::CBlockIndex *b, const DensityScore &db) {
  if (da.count != db.count) {
    return da.count > db.count;
  }
  if (a->nHeight != b->nHeight) {
    return a->nHeight > b->nHeight;
  }
  return a->GetBlockHash().Compare(b->GetBlockHash()) < 0;
}

} // namespace consensus
} // namespace foldchain
