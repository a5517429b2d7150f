// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_CHAIN_BLOCK_MANAGER_HPP
#define FOLDCHAIN_CHAIN_BLOCK_MANAGER_HPP

#include "chain/block_index.hpp"
#include "chain/block_store.hpp"
#include "chain/chain.hpp"
#include "primitives/block.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace foldchain {
namespace chain {

// BlockManager - owns every known block index entry and the active chain
//
// Blocks themselves are not kept in memory: the index carries everything
// consensus needs (slot, accumulator state, lifecycle). Full blocks go to the
// injected BlockStore.
//
// STORE LAYOUT:
//   block/<hash>   serialized block
//   index/<hash>   JSON entry: prev hash, height, status, lifecycle state
//   chainstate     JSON document: version, genesis, tip, leaf hashes
// Save() writes only the entries marked dirty since the previous Save(), plus
// the chain document. Load() walks back from the leaves.
//
// THREAD SAFETY: NO internal mutex - caller MUST hold
// ChainstateManager::validation_mutex_. BlockManager is a private member of
// ChainstateManager and all access goes through it.
class BlockManager {
public:
  // Store key of the chain metadata document
  static constexpr const char *META_KEY = "chainstate";
  static constexpr int META_VERSION = 2;

  BlockManager();
  ~BlockManager();

  bool Initialize(const CBlock &genesis);

  CBlockIndex *LookupBlockIndex(const uint256 &hash);
  const CBlockIndex *LookupBlockIndex(const uint256 &hash) const;

  // Create the entry for a block whose parent is already indexed (or the
  // genesis block). Returns the existing entry for a known block. New
  // entries are marked dirty.
  CBlockIndex *AddToBlockIndex(const CBlock &block);

  // Drop a leaf entry. Fails for unknown blocks, blocks with children and
  // blocks on the active chain.
  bool RemoveBlockIndex(const uint256 &hash);

  // Queue an entry whose status or lifecycle changed for the next Save()
  void MarkDirty(const CBlockIndex *pindex);
  size_t GetDirtyCount() const { return m_dirty_blockindex.size(); }

  // Hashes of entries without children
  const std::set<uint256> &GetLeaves() const { return m_leaves; }

  CChain &ActiveChain() { return m_active_chain; }
  const CChain &ActiveChain() const { return m_active_chain; }

  CBlockIndex *GetTip() { return m_active_chain.Tip(); }
  const CBlockIndex *GetTip() const { return m_active_chain.Tip(); }

  void SetActiveTip(CBlockIndex &block) { m_active_chain.SetTip(block); }

  size_t GetBlockCount() const { return m_block_index.size(); }

  const std::map<uint256, CBlockIndex> &GetBlockIndex() const {
    return m_block_index;
  }

  bool HasChildren(const CBlockIndex *pindex) const;

  const uint256 &GetGenesisHash() const { return m_genesis_hash; }

  // Store keys of a serialized block and of its index entry
  static std::string BlockKey(const uint256 &hash);
  static std::string IndexKey(const uint256 &hash);

  bool WriteBlock(BlockStore &store, const CBlock &block) const;
  std::optional<CBlock> ReadBlock(const BlockStore &store,
                                  const uint256 &hash) const;

  // Remove a block and its index entry from the store. Returns false if
  // neither was stored.
  bool EraseBlock(BlockStore &store, const uint256 &hash) const;

  // Write dirty index entries and the chain document
  bool Save(BlockStore &store);

  // Rebuild the index and active chain from the chain document, the index
  // entries and the stored blocks. Returns false if nothing is stored, the
  // genesis differs or any entry or block is missing or corrupt.
  bool Load(const BlockStore &store, const uint256 &expected_genesis_hash);

private:
  // hash -> entry; map owns the entries and its keys are what phashBlock
  // points to
  std::map<uint256, CBlockIndex> m_block_index;

  CChain m_active_chain;

  // Entries changed since the last Save()
  std::set<const CBlockIndex *> m_dirty_blockindex;

  std::set<uint256> m_leaves;

  uint256 m_genesis_hash;
  bool m_initialized{false};
};

} // namespace chain
} // namespace foldchain

#endif // FOLDCHAIN_CHAIN_BLOCK_MANAGER_HPP
