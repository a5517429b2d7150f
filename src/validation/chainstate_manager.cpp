// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "validation/chainstate_manager.hpp"
#include "accumulator/epoch.hpp"
#include "chain/chainparams.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>

namespace foldchain {
namespace validation {

BlockReference BlockReference::From(const chain::CBlockIndex* pindex)
{
    BlockReference ref;
    if (pindex) {
        ref.hash = pindex->GetBlockHash();
        ref.height = pindex->nHeight;
        ref.slot = pindex->nSlot;
    }
    return ref;
}

ChainstateManager::ChainstateManager(const chain::ChainParams& params,
                                     chain::BlockStore* store)
    : block_manager_()
    , params_(params)
    , store_(store)
    , snapshot_(std::make_shared<const ChainSnapshot>())
{
}

ChainstateManager::~ChainstateManager() = default;

uint64_t ChainstateManager::CurrentSlot() const
{
    return validation::GetCurrentSlot(params_);
}

consensus::DensityWindow ChainstateManager::CurrentWindow() const
{
    return consensus::MakeWindow(CurrentSlot(), params_.GetConsensus().nWindowSize);
}

bool ChainstateManager::Initialize(const CBlock& genesis)
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);

    const uint256 hash = genesis.GetHash();
    if (hash != params_.GetConsensus().hashGenesisBlock) {
        LOG_CHAIN_ERROR("Rejected genesis block {} (expected {})", hash.ToString(),
                        params_.GetConsensus().hashGenesisBlock.ToString());
        return false;
    }

    if (!block_manager_.Initialize(genesis)) {
        return false;
    }

    chain::CBlockIndex* pgenesis = block_manager_.GetTip();
    pgenesis->RaiseValidity(chain::BLOCK_VALID_ACCUMULATOR);
    pgenesis->state = chain::BlockState::Finalized;
    block_manager_.MarkDirty(pgenesis);
    finalized_ = pgenesis;
    chain_selector_.AddCandidateUnchecked(pgenesis);

    if (store_ && !block_manager_.WriteBlock(*store_, genesis)) {
        return false;
    }
    Persist();
    PublishSnapshot(CurrentWindow());

    LOG_CHAIN_INFO("Initialized chainstate with genesis {}", hash.ToString().substr(0, 16));
    return true;
}

bool ChainstateManager::Load()
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);

    if (!store_) {
        LOG_CHAIN_ERROR("Load: no block store configured");
        return false;
    }

    if (!block_manager_.Load(*store_, params_.GetConsensus().hashGenesisBlock)) {
        return false;
    }

    chain_selector_.ClearCandidates();
    m_failed_blocks.clear();
    finalized_ = nullptr;

    // Every viable entry goes in, then non-leaves are dropped
    for (const auto& [hash, entry] : block_manager_.GetBlockIndex()) {
        chain::CBlockIndex* pindex = block_manager_.LookupBlockIndex(hash);
        if (pindex->nStatus & chain::BLOCK_FAILED_MASK) {
            m_failed_blocks.insert(pindex);
            continue;
        }
        if (pindex->IsValid() && !pindex->IsOrphaned()) {
            chain_selector_.AddCandidateUnchecked(pindex);
        }
    }
    chain_selector_.PruneBlockIndexCandidates(block_manager_);

    // Highest finalized block on the active chain
    for (chain::CBlockIndex* pindex = block_manager_.GetTip(); pindex; pindex = pindex->pprev) {
        if (pindex->IsFinalized()) {
            finalized_ = pindex;
            break;
        }
    }
    if (!finalized_) {
        LOG_CHAIN_ERROR("Load: stored chain has no finalized block");
        return false;
    }

    PublishSnapshot(CurrentWindow());

    const chain::CBlockIndex* tip = block_manager_.GetTip();
    LOG_CHAIN_INFO("Loaded chain state: {} blocks, {} leaves, {} candidates, {} failed, "
                   "tip height={} finalized height={}",
                   block_manager_.GetBlockCount(), block_manager_.GetLeaves().size(),
                   chain_selector_.GetCandidateCount(), m_failed_blocks.size(),
                   tip ? tip->nHeight : -1, finalized_->nHeight);
    return true;
}

std::optional<ConsensusDecision> ChainstateManager::SubmitBlock(const CBlock& block,
                                                                ValidationState& state)
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);

    const uint256 hash = block.GetHash();

    // Step 1: Duplicate
    if (block_manager_.LookupBlockIndex(hash)) {
        state.Invalid(BlockValidationResult::DUPLICATE, "duplicate", "block already known");
        return std::nullopt;
    }

    if (!block_manager_.GetTip()) {
        state.Error("not-initialized", "chainstate has no genesis block");
        return std::nullopt;
    }

    // Step 2: Only Initialize() adds a block without parent
    if (block.hashPrevBlock.IsNull()) {
        state.Invalid(BlockValidationResult::UNKNOWN_PARENT, "bad-genesis",
                      "block without parent is not the configured genesis");
        return std::nullopt;
    }

    // Step 3: Parent must be indexed and viable
    chain::CBlockIndex* pindexPrev = block_manager_.LookupBlockIndex(block.hashPrevBlock);
    if (!pindexPrev) {
        LOG_CONSENSUS_DEBUG("Block {}: parent {} not found", hash.ToString().substr(0, 16),
                            block.hashPrevBlock.ToString().substr(0, 16));
        state.Invalid(BlockValidationResult::UNKNOWN_PARENT, "prev-blk-not-found",
                      "parent is not known");
        return std::nullopt;
    }
    if (!pindexPrev->IsValid() || pindexPrev->IsOrphaned()) {
        LOG_CONSENSUS_DEBUG("Block {}: parent {} is {}", hash.ToString().substr(0, 16),
                            block.hashPrevBlock.ToString().substr(0, 16),
                            chain::BlockStateToString(pindexPrev->state));
        state.Invalid(BlockValidationResult::INVALID_PARENT, "bad-prevblk",
                      "parent failed validation or is orphaned");
        return std::nullopt;
    }

    // Step 4: Layered validation
    const uint64_t current_slot = CurrentSlot();
    bool valid = CheckBlock(block, params_, state);
    if (valid) {
        valid = ContextualCheckBlock(block, pindexPrev, params_, current_slot, state);
    }
    if (valid) {
        valid = CheckBlockAccumulator(block, pindexPrev, params_, state);
    }

    // Only a header failure condemns the identifier. Anything else (payload,
    // accumulator, the local clock) leaves no trace, so the intact block can
    // still arrive under the same hash.
    if (!valid && !IsHeaderFailure(state.GetResult())) {
        LOG_CONSENSUS_DEBUG("Block {} rejected: {}", hash.ToString().substr(0, 16),
                            state.ToString());
        return std::nullopt;
    }

    // Step 5: Index
    chain::CBlockIndex* pindex = block_manager_.AddToBlockIndex(block);
    if (!pindex) {
        state.Error("index-failed", "failed to add block to index");
        return std::nullopt;
    }
    pindex->RaiseValidity(chain::BLOCK_VALID_TREE);
    if (store_ && !block_manager_.WriteBlock(*store_, block)) {
        LOG_CHAIN_WARN("Block {} indexed but not stored", hash.ToString().substr(0, 16));
    }

    const consensus::DensityWindow window = CurrentWindow();

    if (!valid) {
        LOG_CONSENSUS_WARN("Block {} at height {} failed validation: {}",
                           hash.ToString().substr(0, 16), pindex->nHeight, state.ToString());
        pindex->nStatus |= chain::BLOCK_FAILED_VALID;
        m_failed_blocks.insert(pindex);
        MarkOrphaned(pindex);
        Persist();
        PublishSnapshot(window);
        return std::nullopt;
    }

    // Step 6: Validated, then fork choice
    pindex->RaiseValidity(chain::BLOCK_VALID_ACCUMULATOR);
    pindex->state = chain::BlockState::Validated;
    chain_selector_.TryAddBlockIndexCandidate(pindex, block_manager_);

    LOG_CONSENSUS_DEBUG("Validated block {} height={} slot={}", hash.ToString().substr(0, 16),
                        pindex->nHeight, pindex->nSlot);

    const chain::CBlockIndex* old_tip = block_manager_.GetTip();
    bool reorganized = false;
    if (!ActivateBestChain(window, &reorganized)) {
        LOG_CONSENSUS_ERROR("ActivateBestChain failed after block {}",
                            hash.ToString().substr(0, 16));
    }
    const bool head_changed = block_manager_.GetTip() != old_tip;

    // Scored before orphaning: a block that lost outright still reports the
    // density it was judged on
    ConsensusDecision decision;
    decision.density = consensus::ScoreChain(pindex, window);

    UpdateFinality();
    UpdateOrphans(head_changed);
    Persist();
    PublishSnapshot(window);

    decision.block = BlockReference::From(pindex);
    decision.canonical_head = BlockReference::From(block_manager_.GetTip());
    decision.head_changed = head_changed;
    decision.reorganized = reorganized;
    return decision;
}

bool ChainstateManager::OnSlotTick()
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);

    if (!block_manager_.GetTip()) {
        return false;
    }

    const consensus::DensityWindow window = CurrentWindow();
    const chain::CBlockIndex* old_tip = block_manager_.GetTip();
    bool reorganized = false;
    if (!ActivateBestChain(window, &reorganized)) {
        LOG_CONSENSUS_ERROR("ActivateBestChain failed at slot {}", window.end_slot);
    }

    const bool changed = block_manager_.GetTip() != old_tip;
    if (changed) {
        UpdateFinality();
        UpdateOrphans(true);
        Persist();
    }
    PublishSnapshot(window);

    LOG_CONSENSUS_TRACE("Slot tick {}: head {}", window.end_slot, changed ? "changed" : "unchanged");
    return changed;
}

bool ChainstateManager::ActivateBestChain(const consensus::DensityWindow& window, bool* reorganized)
{
    chain::CBlockIndex* pindexBest = chain_selector_.FindBestChain(window, finalized_);
    if (!pindexBest) {
        LOG_CONSENSUS_DEBUG("ActivateBestChain: no viable candidates");
        return true;
    }

    chain::CBlockIndex* pindexOldTip = block_manager_.GetTip();
    if (pindexOldTip == pindexBest) {
        return true;
    }

    const chain::CBlockIndex* pindexFork = chain::LastCommonAncestor(pindexOldTip, pindexBest);
    if (!pindexFork) {
        LOG_CONSENSUS_ERROR("ActivateBestChain: no common ancestor between tip {} and candidate {}",
                            pindexOldTip ? pindexOldTip->GetBlockHash().ToString() : "null",
                            pindexBest->GetBlockHash().ToString());
        return false;
    }

    // FindBestChain only returns descendants of finalized_, so the fork point
    // is never below it
    if (finalized_ && pindexFork->nHeight < finalized_->nHeight) {
        LOG_CONSENSUS_ERROR("ActivateBestChain: refusing to disconnect finalized block at height {}",
                            finalized_->nHeight);
        return false;
    }

    // Disconnect blocks from old tip to fork point
    std::vector<chain::CBlockIndex*> disconnected_blocks;
    while (block_manager_.GetTip() != pindexFork) {
        disconnected_blocks.push_back(block_manager_.GetTip());
        if (!DisconnectTip()) {
            LOG_CONSENSUS_ERROR("Failed to disconnect block during reorg");
            return false;
        }
    }

    // Connect blocks from fork point to new tip
    std::vector<chain::CBlockIndex*> connect_blocks;
    for (chain::CBlockIndex* pindexWalk = pindexBest; pindexWalk != pindexFork;
         pindexWalk = pindexWalk->pprev) {
        connect_blocks.push_back(pindexWalk);
    }

    for (auto it = connect_blocks.rbegin(); it != connect_blocks.rend(); ++it) {
        if (!ConnectTip(*it)) {
            LOG_CONSENSUS_ERROR("Failed to connect block during reorg at height {}", (*it)->nHeight);

            // Roll back to the old tip
            while (block_manager_.GetTip() != pindexFork) {
                if (!DisconnectTip()) {
                    LOG_CONSENSUS_ERROR("CRITICAL: Rollback failed! Chain state may be inconsistent!");
                    return false;
                }
            }
            for (auto rit = disconnected_blocks.rbegin(); rit != disconnected_blocks.rend(); ++rit) {
                if (!ConnectTip(*rit)) {
                    LOG_CONSENSUS_ERROR("CRITICAL: Failed to restore old chain! Chain state may be inconsistent!");
                    return false;
                }
            }
            LOG_CONSENSUS_INFO("Rollback successful - restored old tip at height {}",
                               block_manager_.GetTip()->nHeight);
            return false;
        }
    }

    if (reorganized) {
        *reorganized = !disconnected_blocks.empty();
    }

    if (!disconnected_blocks.empty()) {
        LOG_CONSENSUS_WARN("REORGANIZE: Disconnect {} blocks; Connect {} blocks",
                           disconnected_blocks.size(), connect_blocks.size());
        LOG_CONSENSUS_INFO("REORGANIZE: Old tip: height={}, hash={}", pindexOldTip->nHeight,
                           pindexOldTip->GetBlockHash().ToString().substr(0, 16));
        LOG_CONSENSUS_INFO("REORGANIZE: New tip: height={}, hash={}", pindexBest->nHeight,
                           pindexBest->GetBlockHash().ToString().substr(0, 16));
        LOG_CONSENSUS_INFO("REORGANIZE: Fork point: height={}, hash={}", pindexFork->nHeight,
                           pindexFork->GetBlockHash().ToString().substr(0, 16));
    } else {
        LOG_CONSENSUS_INFO("New canonical head: height={} slot={} hash={}", pindexBest->nHeight,
                           pindexBest->nSlot, pindexBest->GetBlockHash().ToString().substr(0, 16));
    }

    notifications_.NotifyChainTip(pindexBest, pindexBest->nHeight);
    return true;
}

bool ChainstateManager::ConnectTip(chain::CBlockIndex* pindexNew)
{
    if (!pindexNew) {
        LOG_CONSENSUS_ERROR("ConnectTip: null block index");
        return false;
    }

    // Subscribers of BlockConnected already see the new tip
    block_manager_.SetActiveTip(*pindexNew);

    LOG_CONSENSUS_DEBUG("ConnectTip: height={}, hash={}", pindexNew->nHeight,
                        pindexNew->GetBlockHash().ToString().substr(0, 16));

    notifications_.NotifyBlockConnected(pindexNew->GetBlockHeader(), pindexNew);
    return true;
}

bool ChainstateManager::DisconnectTip()
{
    chain::CBlockIndex* pindexDelete = block_manager_.GetTip();
    if (!pindexDelete) {
        LOG_CONSENSUS_ERROR("DisconnectTip: no tip to disconnect");
        return false;
    }
    if (!pindexDelete->pprev) {
        LOG_CONSENSUS_ERROR("DisconnectTip: cannot disconnect genesis block");
        return false;
    }
    if (pindexDelete->IsFinalized()) {
        LOG_CONSENSUS_ERROR("DisconnectTip: block {} is finalized",
                            pindexDelete->GetBlockHash().ToString().substr(0, 16));
        return false;
    }

    LOG_CONSENSUS_DEBUG("DisconnectTip: height={}, hash={}", pindexDelete->nHeight,
                        pindexDelete->GetBlockHash().ToString().substr(0, 16));

    // Subscribers of BlockDisconnected still see the block being removed
    notifications_.NotifyBlockDisconnected(pindexDelete->GetBlockHeader(), pindexDelete);
    block_manager_.SetActiveTip(*pindexDelete->pprev);
    return true;
}

void ChainstateManager::UpdateFinality()
{
    const chain::CBlockIndex* tip = block_manager_.GetTip();
    if (!tip || !finalized_) {
        return;
    }

    const int final_height = tip->nHeight - params_.GetConsensus().nConfirmationDepth;
    const chain::CChain& active = block_manager_.ActiveChain();
    for (int height = finalized_->nHeight + 1; height <= final_height; ++height) {
        chain::CBlockIndex* pindex = active[height];
        pindex->state = chain::BlockState::Finalized;
        block_manager_.MarkDirty(pindex);
        finalized_ = pindex;
        LOG_CONSENSUS_DEBUG("Finalized block {} at height {}",
                            pindex->GetBlockHash().ToString().substr(0, 16), pindex->nHeight);
        notifications_.NotifyBlockFinalized(pindex);
    }
}

void ChainstateManager::UpdateOrphans(bool head_changed)
{
    if (!finalized_) {
        return;
    }

    const chain::CChain& active = block_manager_.ActiveChain();
    std::vector<chain::CBlockIndex*> newly_orphaned;
    for (const auto& [hash, entry] : block_manager_.GetBlockIndex()) {
        if (entry.IsOrphaned() || active.Contains(&entry)) {
            continue;
        }
        const chain::CBlockIndex* pfork = active.FindFork(&entry);
        if (head_changed || !pfork || pfork->nHeight < finalized_->nHeight) {
            newly_orphaned.push_back(block_manager_.LookupBlockIndex(hash));
        }
    }

    for (chain::CBlockIndex* pindex : newly_orphaned) {
        MarkOrphaned(pindex);
    }
    if (!newly_orphaned.empty()) {
        LOG_CONSENSUS_INFO("Orphaned {} blocks off the canonical chain (head height={}, finalized height={})",
                           newly_orphaned.size(), active.Height(), finalized_->nHeight);
    }
}

void ChainstateManager::MarkOrphaned(chain::CBlockIndex* pindex)
{
    pindex->state = chain::BlockState::Orphaned;
    block_manager_.MarkDirty(pindex);
    chain_selector_.RemoveCandidate(pindex);
    notifications_.NotifyBlockOrphaned(pindex);
}

size_t ChainstateManager::PruneOrphans()
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);

    size_t removed = 0;
    bool progress = true;
    while (progress) {
        progress = false;

        std::vector<uint256> leaves;
        for (const auto& [hash, entry] : block_manager_.GetBlockIndex()) {
            if (entry.IsOrphaned() && !block_manager_.HasChildren(&entry)) {
                leaves.push_back(hash);
            }
        }

        for (const uint256& hash : leaves) {
            chain::CBlockIndex* pindex = block_manager_.LookupBlockIndex(hash);
            chain_selector_.RemoveCandidate(pindex);
            m_failed_blocks.erase(pindex);
            if (!block_manager_.RemoveBlockIndex(hash)) {
                continue;
            }
            if (store_ && !block_manager_.EraseBlock(*store_, hash)) {
                LOG_CHAIN_DEBUG("Pruned block {} was not in the store", hash.ToString().substr(0, 16));
            }
            ++removed;
            progress = true;
        }
    }

    if (removed > 0) {
        LOG_CHAIN_INFO("Pruned {} orphaned blocks ({} remain)", removed, block_manager_.GetBlockCount());
        Persist();
        PublishSnapshot(CurrentWindow());
    }
    return removed;
}

BlockReference ChainstateManager::GetCanonicalHead() const
{
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_->head;
}

std::shared_ptr<const ChainSnapshot> ChainstateManager::GetSnapshot() const
{
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

std::optional<accumulator::AccumulatorProof>
ChainstateManager::GetAccumulatorProof(int first_height, int last_height) const
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);

    const chain::CChain& active = block_manager_.ActiveChain();
    const size_t domain = params_.GetConsensus().nAccumulatorDomainSize;

    if (first_height < 0 || last_height < first_height || last_height > active.Height()) {
        LOG_CONSENSUS_DEBUG("GetAccumulatorProof: range [{}, {}] outside chain of height {}",
                            first_height, last_height, active.Height());
        return std::nullopt;
    }
    if (accumulator::EpochOf(first_height, domain) != accumulator::EpochOf(last_height, domain)) {
        LOG_CONSENSUS_DEBUG("GetAccumulatorProof: range [{}, {}] spans epochs", first_height,
                            last_height);
        return std::nullopt;
    }

    const int epoch_start = accumulator::EpochStartHeight(first_height, domain);
    const int anchor_height =
        std::min(accumulator::EpochEndHeight(first_height, domain), active.Height());
    const chain::CBlockIndex* anchor = active[anchor_height];

    // Committed digests of the anchor's state, in commit order
    std::vector<crypto::FieldElement> digests;
    if (epoch_start > 0) {
        digests.push_back(active[epoch_start - 1]->accumulator.GetCheckpointDigest());
    }
    for (int height = epoch_start; height <= anchor_height; ++height) {
        digests.push_back(active[height]->GetDigest());
    }

    std::vector<crypto::FieldElement> members;
    for (int height = first_height; height <= last_height; ++height) {
        members.push_back(active[height]->GetDigest());
    }

    accumulator::AccumulatorProof proof;
    try {
        proof.witness = accumulator::Prove(digests, members, domain);
    } catch (const accumulator::ProofError& e) {
        LOG_CONSENSUS_ERROR("GetAccumulatorProof: {} ({})", e.what(),
                            accumulator::ProofErrorCodeString(e.code()));
        return std::nullopt;
    }
    proof.state = anchor->accumulator;
    proof.anchor = anchor->GetBlockHash();
    proof.first_height = first_height;
    proof.last_height = last_height;
    return proof;
}

bool ChainstateManager::VerifyProof(const accumulator::AccumulatorProof& proof,
                                    const crypto::FieldElement& digest) const
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);

    const chain::CBlockIndex* anchor = block_manager_.LookupBlockIndex(proof.anchor);
    if (!anchor || !anchor->IsValid() || anchor->IsOrphaned()) {
        LOG_CONSENSUS_DEBUG("VerifyProof: anchor {} is unknown or not viable",
                            proof.anchor.ToString().substr(0, 16));
        return false;
    }
    if (anchor->accumulator != proof.state) {
        LOG_CONSENSUS_DEBUG("VerifyProof: state differs from anchor {}",
                            proof.anchor.ToString().substr(0, 16));
        return false;
    }
    return accumulator::VerifyProof(proof, digest);
}

std::optional<consensus::DensityScore> ChainstateManager::GetDensity(const uint256& hash) const
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
    const chain::CBlockIndex* pindex = block_manager_.LookupBlockIndex(hash);
    if (!pindex) {
        return std::nullopt;
    }
    return consensus::ScoreChain(pindex, CurrentWindow());
}

std::optional<chain::BlockState> ChainstateManager::GetBlockState(const uint256& hash) const
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
    const chain::CBlockIndex* pindex = block_manager_.LookupBlockIndex(hash);
    if (!pindex) {
        return std::nullopt;
    }
    return pindex->state;
}

const chain::CBlockIndex* ChainstateManager::GetFinalizedTip() const
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
    return finalized_;
}

const chain::CBlockIndex* ChainstateManager::GetTip() const
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
    return block_manager_.GetTip();
}

chain::CBlockIndex* ChainstateManager::LookupBlockIndex(const uint256& hash)
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
    return block_manager_.LookupBlockIndex(hash);
}

const chain::CBlockIndex* ChainstateManager::LookupBlockIndex(const uint256& hash) const
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
    return block_manager_.LookupBlockIndex(hash);
}

bool ChainstateManager::IsOnActiveChain(const chain::CBlockIndex* pindex) const
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
    return pindex && block_manager_.ActiveChain().Contains(pindex);
}

const chain::CBlockIndex* ChainstateManager::GetBlockAtHeight(int height) const
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
    return block_manager_.ActiveChain()[height];
}

size_t ChainstateManager::GetBlockCount() const
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
    return block_manager_.GetBlockCount();
}

int ChainstateManager::GetChainHeight() const
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
    return block_manager_.ActiveChain().Height();
}

std::optional<CBlock> ChainstateManager::ReadBlock(const uint256& hash) const
{
    std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
    if (!store_) {
        return std::nullopt;
    }
    return block_manager_.ReadBlock(*store_, hash);
}

void ChainstateManager::Persist()
{
    if (!store_) {
        return;
    }
    // Writes only the entries changed since the last call
    const size_t dirty = block_manager_.GetDirtyCount();
    if (!block_manager_.Save(*store_)) {
        LOG_CHAIN_ERROR("Failed to persist chain metadata ({} changed entries)", dirty);
    }
}

void ChainstateManager::PublishSnapshot(const consensus::DensityWindow& window)
{
    auto snapshot = std::make_shared<ChainSnapshot>();
    const chain::CBlockIndex* tip = block_manager_.GetTip();
    snapshot->head = BlockReference::From(tip);
    snapshot->finalized = BlockReference::From(finalized_);
    snapshot->window_end_slot = window.end_slot;
    snapshot->window_size = window.size;
    if (tip) {
        snapshot->head_density = consensus::ScoreChain(tip, window);
    }
    for (const auto& scored : chain_selector_.ScoreCandidates(window, finalized_)) {
        snapshot->tips.push_back({BlockReference::From(scored.tip), scored.score});
    }
    snapshot->block_count = block_manager_.GetBlockCount();

    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_ = std::move(snapshot);
}

} // namespace validation
} // namespace foldchain
