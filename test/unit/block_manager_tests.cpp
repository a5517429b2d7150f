// Copyright (c) 2024 FoldChain
// Unit tests for BlockManager and the in-memory block store

#include <catch2/catch_test_macros.hpp>
#include "chain/block_manager.hpp"
#include "test_helpers.hpp"

using namespace foldchain;
using namespace foldchain::chain;
using foldchain::test::BuildBlock;
using foldchain::test::Record;

TEST_CASE("MemoryBlockStore - Key/value operations", "[block_store]") {
    MemoryBlockStore store;
    const std::vector<uint8_t> value{1, 2, 3};

    REQUIRE_FALSE(store.Has("k"));
    REQUIRE_FALSE(store.Get("k").has_value());
    REQUIRE(store.Put("k", value));
    REQUIRE(store.Has("k"));
    REQUIRE(*store.Get("k") == value);
    REQUIRE(store.Size() == 1);

    REQUIRE(store.Put("k", {9}));
    REQUIRE(*store.Get("k") == std::vector<uint8_t>{9});

    REQUIRE(store.Erase("k"));
    REQUIRE_FALSE(store.Erase("k"));
    REQUIRE(store.Size() == 0);
}

TEST_CASE("BlockManager - Index", "[block_manager]") {
    auto params = ChainParams::CreateRegTest();
    BlockManager bm;

    REQUIRE(bm.Initialize(params->GenesisBlock()));
    REQUIRE_FALSE(bm.Initialize(params->GenesisBlock()));
    REQUIRE(bm.GetBlockCount() == 1);
    REQUIRE(bm.GetGenesisHash() == params->GetConsensus().hashGenesisBlock);

    CBlockIndex* genesis = bm.GetTip();
    REQUIRE(genesis != nullptr);
    REQUIRE(genesis->nHeight == 0);

    SECTION("Children link to their parent") {
        CBlock block = BuildBlock(*params, *genesis, 1);
        CBlockIndex* pindex = bm.AddToBlockIndex(block);
        REQUIRE(pindex != nullptr);
        REQUIRE(pindex->pprev == genesis);
        REQUIRE(pindex->nHeight == 1);
        REQUIRE(pindex->GetBlockHash() == block.GetHash());
        REQUIRE(bm.HasChildren(genesis));
        REQUIRE_FALSE(bm.HasChildren(pindex));

        SECTION("Adding again returns the same entry") {
            REQUIRE(bm.AddToBlockIndex(block) == pindex);
            REQUIRE(bm.GetBlockCount() == 2);
        }
    }

    SECTION("Unknown parent is refused") {
        CBlock block = BuildBlock(*params, *genesis, 1);
        block.hashPrevBlock = uint256S("1234");
        REQUIRE(bm.AddToBlockIndex(block) == nullptr);
    }

    SECTION("RemoveBlockIndex only removes off-chain leaves") {
        CBlockIndex* a1 = bm.AddToBlockIndex(BuildBlock(*params, *genesis, 1));
        CBlockIndex* a2 = bm.AddToBlockIndex(BuildBlock(*params, *a1, 2));
        const uint256 a1_hash = a1->GetBlockHash();
        const uint256 a2_hash = a2->GetBlockHash();

        REQUIRE_FALSE(bm.RemoveBlockIndex(genesis->GetBlockHash()));
        REQUIRE_FALSE(bm.RemoveBlockIndex(a1_hash));
        REQUIRE(bm.RemoveBlockIndex(a2_hash));
        REQUIRE(bm.RemoveBlockIndex(a1_hash));
        REQUIRE_FALSE(bm.RemoveBlockIndex(a1_hash));
        REQUIRE(bm.GetBlockCount() == 1);
    }
}

TEST_CASE("BlockManager - Persistence", "[block_manager]") {
    auto params = ChainParams::CreateRegTest();
    MemoryBlockStore store;
    BlockManager bm;
    REQUIRE(bm.Initialize(params->GenesisBlock()));
    REQUIRE(bm.WriteBlock(store, params->GenesisBlock()));

    CBlockIndex* tip = bm.GetTip();
    tip->RaiseValidity(BLOCK_VALID_ACCUMULATOR);
    tip->state = BlockState::Finalized;
    for (uint64_t slot = 1; slot <= 4; slot++) {
        CBlock block = BuildBlock(*params, *tip, slot, 1, {Record("r" + std::to_string(slot))});
        REQUIRE(bm.WriteBlock(store, block));
        tip = bm.AddToBlockIndex(block);
        tip->RaiseValidity(BLOCK_VALID_ACCUMULATOR);
        tip->state = BlockState::Validated;
        bm.SetActiveTip(*tip);
    }
    CBlock side = BuildBlock(*params, *bm.ActiveChain()[2], 7, 2);
    REQUIRE(bm.WriteBlock(store, side));
    CBlockIndex* side_index = bm.AddToBlockIndex(side);
    side_index->nStatus |= BLOCK_FAILED_VALID;
    side_index->state = BlockState::Orphaned;

    SECTION("Blocks read back intact") {
        auto block = bm.ReadBlock(store, side.GetHash());
        REQUIRE(block.has_value());
        REQUIRE(block->GetHash() == side.GetHash());
        REQUIRE(block->accumulator == side.accumulator);
        REQUIRE_FALSE(bm.ReadBlock(store, uint256S("99")).has_value());
    }

    SECTION("Corrupt stored block is rejected") {
        REQUIRE(store.Put(BlockManager::BlockKey(side.GetHash()), {1, 2, 3}));
        REQUIRE_FALSE(bm.ReadBlock(store, side.GetHash()).has_value());
    }

    SECTION("Save and Load round trip") {
        REQUIRE(bm.Save(store));

        BlockManager loaded;
        REQUIRE(loaded.Load(store, params->GetConsensus().hashGenesisBlock));
        REQUIRE(loaded.GetBlockCount() == 6);
        REQUIRE(loaded.GetTip()->GetBlockHash() == tip->GetBlockHash());
        REQUIRE(loaded.ActiveChain().Height() == 4);

        const CBlockIndex* loaded_side = loaded.LookupBlockIndex(side.GetHash());
        REQUIRE(loaded_side != nullptr);
        REQUIRE(loaded_side->state == BlockState::Orphaned);
        REQUIRE_FALSE(loaded_side->IsValid());
        REQUIRE(loaded_side->pprev == loaded.ActiveChain()[2]);
        REQUIRE(loaded_side->accumulator == side.accumulator);

        const CBlockIndex* loaded_genesis = loaded.ActiveChain().Genesis();
        REQUIRE(loaded_genesis->state == BlockState::Finalized);
        REQUIRE(loaded.ActiveChain()[4]->GetAncestor(1) == loaded.ActiveChain()[1]);
    }

    SECTION("Save writes only changed entries") {
        REQUIRE(bm.GetDirtyCount() == 6);
        REQUIRE(bm.Save(store));
        REQUIRE(bm.GetDirtyCount() == 0);
        REQUIRE(store.Has(BlockManager::IndexKey(side.GetHash())));

        const uint256 genesis_hash = bm.ActiveChain().Genesis()->GetBlockHash();
        REQUIRE(store.Erase(BlockManager::IndexKey(genesis_hash)));

        CBlock next = BuildBlock(*params, *tip, 5, 1);
        REQUIRE(bm.WriteBlock(store, next));
        CBlockIndex* next_index = bm.AddToBlockIndex(next);
        REQUIRE(bm.GetDirtyCount() == 1);
        REQUIRE(bm.Save(store));

        REQUIRE(store.Has(BlockManager::IndexKey(next_index->GetBlockHash())));
        REQUIRE_FALSE(store.Has(BlockManager::IndexKey(genesis_hash)));

        bm.MarkDirty(bm.ActiveChain().Genesis());
        REQUIRE(bm.Save(store));
        REQUIRE(store.Has(BlockManager::IndexKey(genesis_hash)));
    }

    SECTION("Leaves track fork tips") {
        REQUIRE(bm.GetLeaves().size() == 2);
        REQUIRE(bm.GetLeaves().count(tip->GetBlockHash()) == 1);
        REQUIRE(bm.GetLeaves().count(side.GetHash()) == 1);

        REQUIRE(bm.RemoveBlockIndex(side.GetHash()));
        REQUIRE(bm.GetLeaves().size() == 1);
        REQUIRE(bm.EraseBlock(store, side.GetHash()));
        REQUIRE_FALSE(bm.EraseBlock(store, side.GetHash()));
    }

    SECTION("Load refuses another genesis") {
        REQUIRE(bm.Save(store));
        BlockManager loaded;
        REQUIRE_FALSE(loaded.Load(store, uint256S("abcd")));
    }

    SECTION("Load fails when a block is missing") {
        REQUIRE(bm.Save(store));
        REQUIRE(store.Erase(BlockManager::BlockKey(side.GetHash())));
        BlockManager loaded;
        REQUIRE_FALSE(loaded.Load(store, params->GetConsensus().hashGenesisBlock));
        REQUIRE(loaded.GetBlockCount() == 0);
    }

    SECTION("Load fails when an index entry is missing") {
        REQUIRE(bm.Save(store));
        REQUIRE(store.Erase(BlockManager::IndexKey(bm.ActiveChain()[1]->GetBlockHash())));
        BlockManager loaded;
        REQUIRE_FALSE(loaded.Load(store, params->GetConsensus().hashGenesisBlock));
        REQUIRE(loaded.GetBlockCount() == 0);
    }

    SECTION("Load with an empty store") {
        MemoryBlockStore empty;
        BlockManager loaded;
        REQUIRE_FALSE(loaded.Load(empty, params->GetConsensus().hashGenesisBlock));
    }
}
