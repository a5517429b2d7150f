// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "chain/block_assembler.hpp"
#include "accumulator/epoch.hpp"
#include "chain/block_index.hpp"
#include "util/logging.hpp"

namespace foldchain {
namespace chain {

CBlock BlockAssembler::CreateBlock(const CBlockIndex &parent, uint64_t slot,
                                   crypto::MerkleLeaves payload) const {
  return Assemble(parent.GetBlockHash(), parent.accumulator,
                  parent.nHeight + 1, slot, std::move(payload));
}

CBlock BlockAssembler::CreateBlock(const CBlock &parent, int parent_height,
                                   uint64_t slot,
                                   crypto::MerkleLeaves payload) const {
  return Assemble(parent.GetHash(), parent.accumulator, parent_height + 1,
                  slot, std::move(payload));
}

CBlock BlockAssembler::Assemble(const uint256 &parent_hash,
                                const accumulator::AccumulatorState &parent_state,
                                int height, uint64_t slot,
                                crypto::MerkleLeaves payload) const {
  CBlock block;
  block.hashPrevBlock = parent_hash;
  block.nSlot = slot;
  block.producer = producer_;
  block.vPayload = std::move(payload);
  block.hashMerkleRoot = crypto::ComputeMerkleRoot(block.vPayload);

  // The header is final here, so the digest is too
  block.accumulator = accumulator::NextAccumulatorState(
      parent_state, height, block.GetDigest(),
      params_.GetConsensus().nAccumulatorDomainSize);

  LOG_CHAIN_TRACE("Assembled block {} height={} slot={} records={}",
                  block.GetHash().ToString().substr(0, 16), height, slot,
                  block.vPayload.size());
  return block;
}

} // namespace chain
} // namespace foldchain
