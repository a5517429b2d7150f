// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_CHAIN_BLOCK_ASSEMBLER_HPP
#define FOLDCHAIN_CHAIN_BLOCK_ASSEMBLER_HPP

#include "chain/chainparams.hpp"
#include "chain/uint.hpp"
#include "crypto/merkle.hpp"
#include "primitives/block.hpp"
#include <cstdint>

namespace foldchain {
namespace chain {

class CBlockIndex;

/**
 * BlockAssembler - producer-side block construction
 *
 * Commits the payload with the Merkle layer and extends the parent's
 * accumulator with the new block's digest (rolling over to a new epoch when
 * the parent closed one). The result passes every check SubmitBlock makes
 * except the slot clock, which depends on when it is submitted.
 */
class BlockAssembler {
public:
  explicit BlockAssembler(const ChainParams &params) : params_(params) {}

  // Identity written into every produced block
  void SetProducer(const uint160 &producer) { producer_ = producer; }
  const uint160 &GetProducer() const { return producer_; }

  // Child of an indexed block. Throws accumulator::ProofError if the parent
  // state cannot be extended.
  CBlock CreateBlock(const CBlockIndex &parent, uint64_t slot,
                     crypto::MerkleLeaves payload = {}) const;

  // Child of a block at `parent_height` that is not (yet) indexed
  CBlock CreateBlock(const CBlock &parent, int parent_height, uint64_t slot,
                     crypto::MerkleLeaves payload = {}) const;

private:
  CBlock Assemble(const uint256 &parent_hash,
                  const accumulator::AccumulatorState &parent_state,
                  int height, uint64_t slot,
                  crypto::MerkleLeaves payload) const;

  const ChainParams &params_;
  uint160 producer_;
};

} // namespace chain
} // namespace foldchain

#endif // FOLDCHAIN_CHAIN_BLOCK_ASSEMBLER_HPP
