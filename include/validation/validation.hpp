// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_VALIDATION_VALIDATION_HPP
#define FOLDCHAIN_VALIDATION_VALIDATION_HPP

#include "accumulator/reed_solomon.hpp"
#include "primitives/block.hpp"
#include <cstdint>
#include <string>

namespace foldchain {

namespace chain {
class ChainParams;
class CBlockIndex;
} // namespace chain

namespace validation {

/**
 * ============================================================================
 * BLOCK VALIDATION ARCHITECTURE
 * ============================================================================
 *
 * LAYER 1: Context-free (CheckBlock)
 * - Merkle root matches the payload, no duplicated-subtree mutation
 * - Payload within limits, accumulator domain size matches the chain
 *
 * LAYER 2: Contextual (ContextualCheckBlock, needs parent and slot clock)
 * - slot > parent slot                      (SLOT_ORDER_VIOLATION)
 * - slot <= current slot + max future slots (FUTURE_SLOT)
 *
 * LAYER 3: Accumulator (CheckBlockAccumulator, needs parent state)
 * - The block's state must be the parent's state extended with this block's
 *   digest (rolling over at epoch boundaries). The witness for the newest
 *   digest is the extended base state itself, so this is one membership
 *   verification against the block's state.
 *
 * INTEGRATION POINT:
 * - ChainstateManager::SubmitBlock() runs the layers in order and decides
 *   whether a failing block is indexed (and orphaned) or dropped.
 * ============================================================================
 */

enum class BlockValidationResult {
  VALID,
  MUTATED,              // payload does not match the Merkle root
  SLOT_ORDER_VIOLATION, // slot <= parent slot
  FUTURE_SLOT,          // slot beyond the permitted bound
  UNKNOWN_PARENT,       // parent not indexed
  INVALID_PARENT,       // parent failed validation or is orphaned
  DUPLICATE,            // already known
  PROOF_DEGREE_EXCEEDED,
  PROOF_MEMBERSHIP_FAILED,
  PROOF_SIZE_MISMATCH,
};

const char *BlockValidationResultToString(BlockValidationResult result);

BlockValidationResult
ProofErrorToValidationResult(accumulator::ProofError::Code code);

bool IsProofFailure(BlockValidationResult result);

// True for failures in fields the block hash commits to (the header). Only
// these condemn the identifier itself.
bool IsHeaderFailure(BlockValidationResult result);

/**
 * Validation state - tracks why validation failed
 * Simplified from Bitcoin Core's BlockValidationState
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID, // Invalid block (permanent failure)
    ERROR    // System error (temporary failure)
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }

  bool Invalid(BlockValidationResult code, const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    code_ = code;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string &reject_reason,
             const std::string &debug_message = "") {
    result_ = Result::ERROR;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  BlockValidationResult GetResult() const { return code_; }
  std::string GetRejectReason() const { return reject_reason_; }
  std::string GetDebugMessage() const { return debug_message_; }

  std::string ToString() const;

private:
  Result result_;
  BlockValidationResult code_{BlockValidationResult::VALID};
  std::string reject_reason_;
  std::string debug_message_;
};

/**
 * Context-independent checks
 *
 * A block failing here is not indexed: its identifier does not commit to
 * the payload bytes, so the same identifier may still arrive intact.
 */
bool CheckBlock(const CBlock &block, const chain::ChainParams &params,
                ValidationState &state);

/**
 * Slot checks against the parent and the local slot clock
 *
 * @param pindexPrev Parent entry (nullptr fails with UNKNOWN_PARENT)
 * @param current_slot Current slot of the local clock
 */
bool ContextualCheckBlock(const CBlock &block,
                          const chain::CBlockIndex *pindexPrev,
                          const chain::ChainParams &params,
                          uint64_t current_slot, ValidationState &state);

// Accumulator state must extend the parent's with this block's digest
bool CheckBlockAccumulator(const CBlock &block,
                           const chain::CBlockIndex *pindexPrev,
                           const chain::ChainParams &params,
                           ValidationState &state);

/**
 * All three layers in order. Used by callers that only need a verdict;
 * ChainstateManager runs the layers itself to index between them.
 */
bool ValidateBlock(const CBlock &block, const chain::CBlockIndex *pindexPrev,
                   const chain::ChainParams &params, uint64_t current_slot,
                   ValidationState &state);

// Slot of the local clock: (GetTime() - genesis time) / slot duration
uint64_t GetCurrentSlot(const chain::ChainParams &params);

} // namespace validation
} // namespace foldchain

#endif // FOLDCHAIN_VALIDATION_VALIDATION_HPP
