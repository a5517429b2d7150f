// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "validation/validation.hpp"
#include "accumulator/epoch.hpp"
#include "chain/block_index.hpp"
#include "chain/chainparams.hpp"
#include "crypto/merkle.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace foldchain {
namespace validation {

const char *BlockValidationResultToString(BlockValidationResult result) {
  switch (result) {
  case BlockValidationResult::VALID:
    return "valid";
  case BlockValidationResult::MUTATED:
    return "mutated";
  case BlockValidationResult::SLOT_ORDER_VIOLATION:
    return "slot-order-violation";
  case BlockValidationResult::FUTURE_SLOT:
    return "future-slot";
  case BlockValidationResult::UNKNOWN_PARENT:
    return "unknown-parent";
  case BlockValidationResult::INVALID_PARENT:
    return "invalid-parent";
  case BlockValidationResult::DUPLICATE:
    return "duplicate";
  case BlockValidationResult::PROOF_DEGREE_EXCEEDED:
    return "proof-degree-exceeded";
  case BlockValidationResult::PROOF_MEMBERSHIP_FAILED:
    return "proof-membership-failed";
  case BlockValidationResult::PROOF_SIZE_MISMATCH:
    return "proof-size-mismatch";
  }
  return "unknown";
}

BlockValidationResult
ProofErrorToValidationResult(accumulator::ProofError::Code code) {
  switch (code) {
  case accumulator::ProofError::Code::DegreeExceeded:
    return BlockValidationResult::PROOF_DEGREE_EXCEEDED;
  case accumulator::ProofError::Code::MembershipFailed:
    return BlockValidationResult::PROOF_MEMBERSHIP_FAILED;
  case accumulator::ProofError::Code::SizeMismatch:
    return BlockValidationResult::PROOF_SIZE_MISMATCH;
  }
  return BlockValidationResult::PROOF_MEMBERSHIP_FAILED;
}

bool IsProofFailure(BlockValidationResult result) {
  return result == BlockValidationResult::PROOF_DEGREE_EXCEEDED ||
         result == BlockValidationResult::PROOF_MEMBERSHIP_FAILED ||
         result == BlockValidationResult::PROOF_SIZE_MISMATCH;
}

bool IsHeaderFailure(BlockValidationResult result) {
  return result == BlockValidationResult::SLOT_ORDER_VIOLATION;
}

std::string ValidationState::ToString() const {
  if (IsValid()) {
    return "valid";
  }
  std::string s = reject_reason_;
  if (!debug_message_.empty()) {
    s += " (" + debug_message_ + ")";
  }
  return s;
}

bool CheckBlock(const CBlock &block, const chain::ChainParams &params,
                ValidationState &state) {
  if (block.vPayload.size() > CBlock::MAX_PAYLOAD_RECORDS) {
    return state.Invalid(BlockValidationResult::MUTATED, "bad-payload-length",
                         "too many payload records");
  }

  bool mutated = false;
  const uint256 root = crypto::ComputeMerkleRoot(block.vPayload, &mutated);
  if (root != block.hashMerkleRoot) {
    return state.Invalid(BlockValidationResult::MUTATED, "bad-merkle-root",
                         "hashMerkleRoot mismatch");
  }
  if (mutated) {
    return state.Invalid(BlockValidationResult::MUTATED, "bad-merkle-mutated",
                         "duplicate payload subtree");
  }

  const size_t domain = params.GetConsensus().nAccumulatorDomainSize;
  if (block.accumulator.DomainSize() != domain) {
    return state.Invalid(BlockValidationResult::PROOF_SIZE_MISMATCH,
                         "bad-accumulator-size",
                         "accumulator domain " +
                             std::to_string(block.accumulator.DomainSize()) +
                             ", expected " + std::to_string(domain));
  }

  return true;
}

bool ContextualCheckBlock(const CBlock &block,
                          const chain::CBlockIndex *pindexPrev,
                          const chain::ChainParams &params,
                          uint64_t current_slot, ValidationState &state) {
  if (!pindexPrev) {
    return state.Invalid(BlockValidationResult::UNKNOWN_PARENT, "prev-blk-not-found",
                         "parent " +
                             block.hashPrevBlock.ToString().substr(0, 16) +
                             " is not known");
  }

  if (block.nSlot <= pindexPrev->nSlot) {
    return state.Invalid(BlockValidationResult::SLOT_ORDER_VIOLATION,
                         "slot-order",
                         "slot " + std::to_string(block.nSlot) +
                             " <= parent slot " +
                             std::to_string(pindexPrev->nSlot));
  }

  const uint64_t bound = current_slot + params.GetConsensus().nMaxFutureSlots;
  if (block.nSlot > bound) {
    return state.Invalid(BlockValidationResult::FUTURE_SLOT, "future-slot",
                         "slot " + std::to_string(block.nSlot) +
                             " beyond permitted slot " + std::to_string(bound));
  }

  return true;
}

bool CheckBlockAccumulator(const CBlock &block,
                           const chain::CBlockIndex *pindexPrev,
                           const chain::ChainParams &params,
                           ValidationState &state) {
  if (!pindexPrev) {
    return state.Invalid(BlockValidationResult::UNKNOWN_PARENT, "prev-blk-not-found");
  }

  const size_t domain = params.GetConsensus().nAccumulatorDomainSize;
  const int height = pindexPrev->nHeight + 1;
  const crypto::FieldElement digest = block.GetDigest();

  // The state before this block's digest: the parent's, or a fresh state
  // holding the parent's checkpoint at an epoch boundary
  accumulator::AccumulatorState base;
  if (height % accumulator::EpochLength(domain) == 0) {
    base = accumulator::AccumulatorState::Empty(domain).Append(
        pindexPrev->accumulator.GetCheckpointDigest());
  } else {
    base = pindexPrev->accumulator;
  }

  if (base.IsFull()) {
    return state.Invalid(BlockValidationResult::PROOF_DEGREE_EXCEEDED,
                         "bad-accumulator-degree",
                         "parent accumulator cannot take another digest");
  }

  accumulator::MembershipWitness witness;
  witness.members.push_back(digest);
  witness.codeword = base.Codeword();

  const auto failure =
      accumulator::VerifyDetailed(block.accumulator, digest, witness);
  if (failure) {
    LOG_CONSENSUS_DEBUG("Accumulator check failed for block {} at height {}: {}",
                        block.GetHash().ToString().substr(0, 16), height,
                        accumulator::ProofErrorCodeString(*failure));
    return state.Invalid(ProofErrorToValidationResult(*failure),
                         "bad-accumulator",
                         accumulator::ProofErrorCodeString(*failure));
  }

  return true;
}

bool ValidateBlock(const CBlock &block, const chain::CBlockIndex *pindexPrev,
                   const chain::ChainParams &params, uint64_t current_slot,
                   ValidationState &state) {
  return CheckBlock(block, params, state) &&
         ContextualCheckBlock(block, pindexPrev, params, current_slot,
                              state) &&
         CheckBlockAccumulator(block, pindexPrev, params, state);
}

uint64_t GetCurrentSlot(const chain::ChainParams &params) {
  return params.GetConsensus().SlotAt(util::GetTime());
}

} // namespace validation
} // namespace foldchain
