// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_VALIDATION_CHAINSTATE_MANAGER_HPP
#define FOLDCHAIN_VALIDATION_CHAINSTATE_MANAGER_HPP

#include "accumulator/reed_solomon.hpp"
#include "chain/block_manager.hpp"
#include "chain/block_store.hpp"
#include "consensus/density.hpp"
#include "notifications.hpp"
#include "primitives/block.hpp"
#include "validation/chain_selector.hpp"
#include "validation/validation.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace foldchain {

namespace chain {
class ChainParams;
class CBlockIndex;
} // namespace chain

namespace validation {

// Position of one block: identifier, height and slot
struct BlockReference {
  uint256 hash;
  int height{-1};
  uint64_t slot{0};

  bool IsNull() const { return height < 0; }

  static BlockReference From(const chain::CBlockIndex *pindex);
};

// Outcome of a successful SubmitBlock
struct ConsensusDecision {
  BlockReference block;
  BlockReference canonical_head;
  bool head_changed{false};
  bool reorganized{false};
  // Density of the chain ending at the submitted block
  consensus::DensityScore density;
};

struct TipInfo {
  BlockReference tip;
  consensus::DensityScore density;
};

/**
 * Immutable view of the chain published after every mutation
 *
 * Readers hold the shared_ptr as long as they like; the manager swaps in a
 * new snapshot instead of changing this one.
 */
struct ChainSnapshot {
  BlockReference head;
  BlockReference finalized;
  uint64_t window_end_slot{0};
  uint64_t window_size{0};
  consensus::DensityScore head_density;
  // Viable tips, preferred first
  std::vector<TipInfo> tips;
  size_t block_count{0};
};

// ChainstateManager - coordinator for the slot chain
// Validates submitted blocks, runs density fork choice, tracks finality and
// orphans, persists to the injected BlockStore and emits notifications.
// Each instance is an independent chainstate.
class ChainstateManager {
public:
  // LIFETIME: params (and store, if given) must outlive this manager
  explicit ChainstateManager(const chain::ChainParams &params,
                             chain::BlockStore *store = nullptr);
  virtual ~ChainstateManager();

  ChainstateManager(const ChainstateManager &) = delete;
  ChainstateManager &operator=(const ChainstateManager &) = delete;

  // Genesis must match the configured genesis hash. It starts Finalized.
  bool Initialize(const CBlock &genesis);

  // Rebuild from the store; returns false if it holds no usable chain
  bool Load();

  /**
   * Validate a block, index it and update the canonical head
   *
   * Rejected without indexing: DUPLICATE, UNKNOWN_PARENT, INVALID_PARENT,
   * MUTATED, FUTURE_SLOT and the accumulator failures. The block hash covers
   * the header only, so a bad payload or accumulator says nothing about the
   * block a producer actually made under that identifier. Slot-order
   * failures are in the header and are indexed as failed and Orphaned.
   *
   * @return The decision, or std::nullopt with `state` carrying the reason
   */
  std::optional<ConsensusDecision> SubmitBlock(const CBlock &block,
                                               ValidationState &state);

  // Re-run fork choice for the current slot. Returns true if the head moved.
  bool OnSlotTick();

  // Lock-free with respect to validation (snapshot reads)
  BlockReference GetCanonicalHead() const;
  std::shared_ptr<const ChainSnapshot> GetSnapshot() const;

  /**
   * Membership proof for the canonical blocks at heights
   * [first_height, last_height], which must lie in one epoch
   *
   * The proof is anchored to the latest canonical block of that epoch.
   */
  std::optional<accumulator::AccumulatorProof>
  GetAccumulatorProof(int first_height, int last_height) const;

  // Algebraic check plus: anchor known, valid, not orphaned, same state
  bool VerifyProof(const accumulator::AccumulatorProof &proof,
                   const crypto::FieldElement &digest) const;

  // Density of the chain ending at `hash` in the current window
  std::optional<consensus::DensityScore> GetDensity(const uint256 &hash) const;
  std::optional<chain::BlockState> GetBlockState(const uint256 &hash) const;

  const chain::CBlockIndex *GetFinalizedTip() const;
  const chain::CBlockIndex *GetTip() const;

  chain::CBlockIndex *LookupBlockIndex(const uint256 &hash);
  const chain::CBlockIndex *LookupBlockIndex(const uint256 &hash) const;

  bool IsOnActiveChain(const chain::CBlockIndex *pindex) const;
  const chain::CBlockIndex *GetBlockAtHeight(int height) const;

  size_t GetBlockCount() const;
  int GetChainHeight() const;

  // Stored copy of an indexed block (requires a store)
  std::optional<CBlock> ReadBlock(const uint256 &hash) const;

  // Remove orphaned leaves until none remain. Returns the number removed.
  size_t PruneOrphans();

  uint64_t GetCurrentSlot() const { return CurrentSlot(); }

  ChainNotifications &Notifications() { return notifications_; }

  const chain::ChainParams &GetParams() const { return params_; }

protected:
  // Slot clock (virtual for tests)
  virtual uint64_t CurrentSlot() const;

private:
  // Everything below assumes validation_mutex_ held by caller

  consensus::DensityWindow CurrentWindow() const;

  // Switch the active chain to the preferred candidate
  bool ActivateBestChain(const consensus::DensityWindow &window,
                         bool *reorganized);
  bool ConnectTip(chain::CBlockIndex *pindexNew);
  bool DisconnectTip();

  // Finalize canonical blocks buried under the confirmation depth
  void UpdateFinality();

  // Orphan every block off the active chain once the head has moved to a
  // competing fork or an extension of its own, and blocks forking off below
  // the finalized height
  void UpdateOrphans(bool head_changed);

  void MarkOrphaned(chain::CBlockIndex *pindex);

  void Persist();
  void PublishSnapshot(const consensus::DensityWindow &window);

  chain::BlockManager block_manager_;
  ChainSelector chain_selector_;
  const chain::ChainParams &params_;
  chain::BlockStore *store_;
  ChainNotifications notifications_;

  chain::CBlockIndex *finalized_{nullptr};

  // Failed blocks (BLOCK_FAILED_VALID), kept until pruned
  std::set<chain::CBlockIndex *> m_failed_blocks;

  // THREAD SAFETY: Recursive mutex serializes all validation operations
  // Protected: block_manager_, chain_selector_, finalized_, m_failed_blocks
  // All public methods acquire lock, private methods assume lock held
  mutable std::recursive_mutex validation_mutex_;

  // Guards snapshot_ only; never held while taking validation_mutex_
  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const ChainSnapshot> snapshot_;
};

} // namespace validation
} // namespace foldchain

#endif // FOLDCHAIN_VALIDATION_CHAINSTATE_MANAGER_HPP
