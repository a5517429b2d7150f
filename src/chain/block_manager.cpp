// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "chain/block_manager.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace foldchain {
namespace chain {

BlockManager::BlockManager() = default;
BlockManager::~BlockManager() = default;

bool BlockManager::Initialize(const CBlock &genesis) {
  LOG_CHAIN_TRACE("Initialize: called with genesis hash={}",
                  genesis.GetHash().ToString().substr(0, 16));

  if (m_initialized) {
    LOG_CHAIN_ERROR("BlockManager already initialized");
    return false;
  }

  CBlockIndex *pindex = AddToBlockIndex(genesis);
  if (!pindex) {
    LOG_CHAIN_ERROR("Failed to add genesis block");
    return false;
  }

  m_active_chain.SetTip(*pindex);
  m_genesis_hash = pindex->GetBlockHash();
  m_initialized = true;

  LOG_CHAIN_TRACE("BlockManager initialized with genesis: {}",
                  m_genesis_hash.ToString());
  return true;
}

CBlockIndex *BlockManager::LookupBlockIndex(const uint256 &hash) {
  auto it = m_block_index.find(hash);
  if (it == m_block_index.end())
    return nullptr;
  return &it->second;
}

const CBlockIndex *BlockManager::LookupBlockIndex(const uint256 &hash) const {
  auto it = m_block_index.find(hash);
  if (it == m_block_index.end())
    return nullptr;
  return &it->second;
}

CBlockIndex *BlockManager::AddToBlockIndex(const CBlock &block) {
  uint256 hash = block.GetHash();

  LOG_CHAIN_TRACE("AddToBlockIndex: hash={} prev={}",
                  hash.ToString().substr(0, 16),
                  block.hashPrevBlock.ToString().substr(0, 16));

  auto it = m_block_index.find(hash);
  if (it != m_block_index.end()) {
    return &it->second;
  }

  CBlockIndex *pprev = nullptr;
  if (!block.hashPrevBlock.IsNull()) {
    pprev = LookupBlockIndex(block.hashPrevBlock);
    if (!pprev) {
      LOG_CHAIN_ERROR("AddToBlockIndex: parent {} of {} is not indexed",
                      block.hashPrevBlock.ToString().substr(0, 16),
                      hash.ToString().substr(0, 16));
      return nullptr;
    }
  }

  auto [iter, inserted] = m_block_index.try_emplace(hash, block);
  if (!inserted) {
    LOG_CHAIN_ERROR("Failed to insert block {}", hash.ToString());
    return nullptr;
  }

  CBlockIndex *pindex = &iter->second;
  pindex->phashBlock = &iter->first;
  pindex->pprev = pprev;
  pindex->nHeight = pprev ? pprev->nHeight + 1 : 0;
  pindex->BuildSkip();

  if (pprev) {
    m_leaves.erase(pprev->GetBlockHash());
  }
  m_leaves.insert(hash);
  MarkDirty(pindex);

  LOG_CHAIN_TRACE("AddToBlockIndex: created entry height={} slot={}",
                  pindex->nHeight, pindex->nSlot);
  return pindex;
}

bool BlockManager::RemoveBlockIndex(const uint256 &hash) {
  auto it = m_block_index.find(hash);
  if (it == m_block_index.end()) {
    return false;
  }
  const CBlockIndex *pindex = &it->second;
  if (m_active_chain.Contains(pindex) || HasChildren(pindex)) {
    LOG_CHAIN_WARN("Refusing to remove block {} (active or has children)",
                   hash.ToString().substr(0, 16));
    return false;
  }

  const CBlockIndex *pprev = pindex->pprev;
  m_dirty_blockindex.erase(pindex);
  m_leaves.erase(hash);
  m_block_index.erase(it);
  if (pprev && !HasChildren(pprev)) {
    m_leaves.insert(pprev->GetBlockHash());
  }
  return true;
}

void BlockManager::MarkDirty(const CBlockIndex *pindex) {
  m_dirty_blockindex.insert(pindex);
}

bool BlockManager::HasChildren(const CBlockIndex *pindex) const {
  return std::any_of(m_block_index.begin(), m_block_index.end(),
                     [pindex](const auto &entry) {
                       return entry.second.pprev == pindex;
                     });
}

std::string BlockManager::BlockKey(const uint256 &hash) {
  return "block/" + hash.GetHex();
}

std::string BlockManager::IndexKey(const uint256 &hash) {
  return "index/" + hash.GetHex();
}

bool BlockManager::WriteBlock(BlockStore &store, const CBlock &block) const {
  const uint256 hash = block.GetHash();
  if (!store.Put(BlockKey(hash), block.SerializeBlock())) {
    LOG_CHAIN_ERROR("Failed to store block {}", hash.ToString());
    return false;
  }
  return true;
}

std::optional<CBlock> BlockManager::ReadBlock(const BlockStore &store,
                                              const uint256 &hash) const {
  auto bytes = store.Get(BlockKey(hash));
  if (!bytes) {
    return std::nullopt;
  }
  CBlock block;
  if (!block.DeserializeBlock(*bytes)) {
    LOG_CHAIN_ERROR("Stored block {} is corrupt", hash.ToString());
    return std::nullopt;
  }
  if (block.GetHash() != hash) {
    LOG_CHAIN_ERROR("Stored block under {} hashes to {}", hash.ToString(),
                    block.GetHash().ToString());
    return std::nullopt;
  }
  return block;
}

bool BlockManager::EraseBlock(BlockStore &store, const uint256 &hash) const {
  const bool had_block = store.Erase(BlockKey(hash));
  const bool had_entry = store.Erase(IndexKey(hash));
  return had_block || had_entry;
}

bool BlockManager::Save(BlockStore &store) {
  using json = nlohmann::json;

  try {
    size_t written = 0;
    for (auto it = m_dirty_blockindex.begin(); it != m_dirty_blockindex.end();) {
      const CBlockIndex *pindex = *it;
      json entry;
      entry["prev_hash"] = pindex->pprev
                               ? pindex->pprev->GetBlockHash().ToString()
                               : uint256().ToString();
      entry["height"] = pindex->nHeight;
      entry["status"] = pindex->nStatus;
      entry["state"] = BlockStateToString(pindex->state);

      const std::string doc = entry.dump();
      if (!store.Put(IndexKey(pindex->GetBlockHash()),
                     std::vector<uint8_t>(doc.begin(), doc.end()))) {
        LOG_CHAIN_ERROR("Failed to write index entry {}",
                        pindex->GetBlockHash().ToString());
        return false;
      }
      it = m_dirty_blockindex.erase(it);
      ++written;
    }

    json root;
    root["version"] = META_VERSION;
    root["block_count"] = m_block_index.size();
    root["genesis_hash"] = m_genesis_hash.ToString();
    root["tip_hash"] =
        m_active_chain.Tip() ? m_active_chain.Tip()->GetBlockHash().ToString()
                             : "";
    json leaves = json::array();
    for (const uint256 &hash : m_leaves) {
      leaves.push_back(hash.ToString());
    }
    root["leaves"] = leaves;

    const std::string doc = root.dump();
    if (!store.Put(META_KEY, std::vector<uint8_t>(doc.begin(), doc.end()))) {
      LOG_CHAIN_ERROR("Failed to write chain metadata");
      return false;
    }

    LOG_CHAIN_TRACE("Saved {} index entries ({} blocks, {} leaves)", written,
                    m_block_index.size(), m_leaves.size());
    return true;
  } catch (const std::exception &e) {
    LOG_CHAIN_ERROR("Exception during Save: {}", e.what());
    return false;
  }
}

namespace {

std::optional<BlockState> ParseBlockState(const std::string &s) {
  for (BlockState state : {BlockState::Pending, BlockState::Validated,
                           BlockState::Finalized, BlockState::Orphaned}) {
    if (s == BlockStateToString(state)) {
      return state;
    }
  }
  return std::nullopt;
}

} // namespace

bool BlockManager::Load(const BlockStore &store,
                        const uint256 &expected_genesis_hash) {
  using json = nlohmann::json;

  auto doc = store.Get(META_KEY);
  if (!doc) {
    LOG_CHAIN_TRACE("No chain metadata in store (starting fresh)");
    return false;
  }

  try {
    json root = json::parse(doc->begin(), doc->end());

    int version = root.value("version", 0);
    if (version != META_VERSION) {
      LOG_CHAIN_ERROR("Unsupported chain metadata version: {}", version);
      return false;
    }

    std::string genesis_hash_str = root.value("genesis_hash", "");
    std::string tip_hash_str = root.value("tip_hash", "");

    uint256 loaded_genesis_hash;
    loaded_genesis_hash.SetHex(genesis_hash_str);
    if (loaded_genesis_hash != expected_genesis_hash) {
      LOG_CHAIN_ERROR("GENESIS MISMATCH: stored genesis {} does not match "
                      "expected genesis {}",
                      genesis_hash_str, expected_genesis_hash.ToString());
      return false;
    }

    m_block_index.clear();
    m_active_chain.Clear();
    m_dirty_blockindex.clear();
    m_leaves.clear();

    // First pass: walk back from every leaf, creating each entry from its
    // index record and stored block
    std::map<uint256, uint256> prev_of;
    std::set<uint256> leaves;
    std::vector<uint256> pending;
    for (const auto &leaf : root.at("leaves")) {
      uint256 hash;
      hash.SetHex(leaf.get<std::string>());
      leaves.insert(hash);
      pending.push_back(hash);
    }

    while (!pending.empty()) {
      const uint256 hash = pending.back();
      pending.pop_back();
      if (m_block_index.count(hash) > 0) {
        continue;
      }

      auto entry_doc = store.Get(IndexKey(hash));
      if (!entry_doc) {
        LOG_CHAIN_ERROR("Index entry for {} not stored", hash.ToString());
        throw std::runtime_error("missing index entry");
      }
      json entry = json::parse(entry_doc->begin(), entry_doc->end());

      std::optional<CBlock> block = ReadBlock(store, hash);
      if (!block) {
        LOG_CHAIN_ERROR("Block {} is indexed but not stored", hash.ToString());
        throw std::runtime_error("missing block");
      }

      auto [iter, inserted] = m_block_index.try_emplace(hash, *block);
      CBlockIndex *pindex = &iter->second;
      pindex->phashBlock = &iter->first;
      pindex->nHeight = entry.at("height").get<int>();
      pindex->nStatus = entry.at("status").get<uint32_t>();
      auto state = ParseBlockState(entry.at("state").get<std::string>());
      if (!state) {
        throw std::runtime_error("bad block state");
      }
      pindex->state = *state;

      uint256 prev_hash;
      prev_hash.SetHex(entry.at("prev_hash").get<std::string>());
      prev_of[hash] = prev_hash;
      if (!prev_hash.IsNull()) {
        pending.push_back(prev_hash);
      }
    }

    const size_t expected_count = root.value("block_count", size_t{0});
    if (m_block_index.size() != expected_count) {
      LOG_CHAIN_ERROR("Chain metadata lists {} blocks, {} reachable from leaves",
                      expected_count, m_block_index.size());
      throw std::runtime_error("block count mismatch");
    }

    // Second pass: connect pprev pointers
    for (auto &[hash, prev_hash] : prev_of) {
      CBlockIndex *pindex = LookupBlockIndex(hash);
      if (prev_hash.IsNull()) {
        pindex->pprev = nullptr;
        continue;
      }
      pindex->pprev = LookupBlockIndex(prev_hash);
      if (!pindex->pprev) {
        LOG_CHAIN_ERROR("Parent block not found for {}: {}", hash.ToString(),
                        prev_hash.ToString());
        throw std::runtime_error("missing parent");
      }
    }

    // Skip pointers need ancestors built first
    std::vector<CBlockIndex *> by_height;
    by_height.reserve(m_block_index.size());
    for (auto &[hash, entry] : m_block_index) {
      by_height.push_back(&entry);
    }
    std::sort(by_height.begin(), by_height.end(),
              [](const CBlockIndex *a, const CBlockIndex *b) {
                return a->nHeight < b->nHeight;
              });
    for (CBlockIndex *pindex : by_height) {
      pindex->BuildSkip();
    }

    m_genesis_hash = loaded_genesis_hash;
    m_leaves = std::move(leaves);
    m_dirty_blockindex.clear();

    if (!tip_hash_str.empty()) {
      uint256 tip_hash;
      tip_hash.SetHex(tip_hash_str);
      CBlockIndex *tip = LookupBlockIndex(tip_hash);
      if (!tip) {
        LOG_CHAIN_ERROR("Tip block not found: {}", tip_hash_str);
        throw std::runtime_error("missing tip");
      }
      m_active_chain.SetTip(*tip);
      LOG_CHAIN_TRACE("Restored active chain to height {}", tip->nHeight);
    }

    m_initialized = true;
    LOG_CHAIN_INFO("Loaded {} blocks from store", m_block_index.size());
    return true;

  } catch (const std::exception &e) {
    LOG_CHAIN_ERROR("Exception during Load: {}", e.what());
    m_block_index.clear();
    m_active_chain.Clear();
    m_dirty_blockindex.clear();
    m_leaves.clear();
    m_initialized = false;
    return false;
  }
}

} // namespace chain
} // namespace foldchain
