// Copyright (c) 2024 FoldChain
// Integration tests for accumulator epochs on a live chain

#include <catch2/catch_test_macros.hpp>
#include "accumulator/epoch.hpp"
#include "test_helpers.hpp"

using namespace foldchain;
using namespace foldchain::test;
using foldchain::chain::CBlockIndex;

TEST_CASE("Epoch rollover - Small domain", "[epoch][integration]") {
    // N = 8: capacity four digests, epochs of three blocks
    chain::ConsensusOverrides overrides;
    overrides.accumulator_domain_size = 8;
    auto params = chain::ChainParams::CreateRegTest(overrides);
    REQUIRE(accumulator::EpochLength(8) == 3);

    TestChainstateManager chainstate(*params);
    REQUIRE(chainstate.Initialize(params->GenesisBlock()));
    chainstate.SetSlot(10);

    const CBlockIndex* tip = ExtendChain(chainstate, chainstate.GetTip(), SlotRange(1, 10));
    REQUIRE(tip->nHeight == 10);

    SECTION("State size never grows") {
        for (int h = 0; h <= 10; h++) {
            REQUIRE(chainstate.GetBlockAtHeight(h)->accumulator.DomainSize() == 8);
        }
    }

    SECTION("Counts restart at every boundary") {
        REQUIRE(chainstate.GetBlockAtHeight(0)->accumulator.Count() == 1);
        REQUIRE(chainstate.GetBlockAtHeight(2)->accumulator.Count() == 3);
        REQUIRE(chainstate.GetBlockAtHeight(3)->accumulator.Count() == 2);
        REQUIRE(chainstate.GetBlockAtHeight(5)->accumulator.Count() == 4);
        REQUIRE(chainstate.GetBlockAtHeight(6)->accumulator.Count() == 2);
        REQUIRE(chainstate.GetBlockAtHeight(9)->accumulator.Count() == 2);
        REQUIRE(chainstate.GetBlockAtHeight(10)->accumulator.Count() == 3);
    }

    SECTION("Proofs inside a closed epoch anchor at its last block") {
        auto proof = chainstate.GetAccumulatorProof(4, 5);
        REQUIRE(proof.has_value());
        REQUIRE(proof->anchor == chainstate.GetBlockAtHeight(5)->GetBlockHash());
        REQUIRE(chainstate.VerifyProof(*proof, chainstate.GetBlockAtHeight(4)->GetDigest()));
        REQUIRE(chainstate.VerifyProof(*proof, chainstate.GetBlockAtHeight(5)->GetDigest()));
        REQUIRE_FALSE(chainstate.VerifyProof(*proof, chainstate.GetBlockAtHeight(3)->GetDigest()));
    }

    SECTION("Genesis epoch") {
        auto proof = chainstate.GetAccumulatorProof(0, 2);
        REQUIRE(proof.has_value());
        REQUIRE(proof->anchor == chainstate.GetBlockAtHeight(2)->GetBlockHash());
        REQUIRE(chainstate.VerifyProof(*proof, params->GenesisBlock().GetDigest()));
    }

    SECTION("Open epoch anchors at the tip") {
        auto proof = chainstate.GetAccumulatorProof(9, 10);
        REQUIRE(proof.has_value());
        REQUIRE(proof->anchor == tip->GetBlockHash());
        REQUIRE(chainstate.VerifyProof(*proof, tip->GetDigest()));
    }

    SECTION("Ranges across a boundary are refused") {
        REQUIRE_FALSE(chainstate.GetAccumulatorProof(2, 3).has_value());
        REQUIRE_FALSE(chainstate.GetAccumulatorProof(1, 7).has_value());
    }

    SECTION("The checkpoint links consecutive epochs") {
        const CBlockIndex* last_of_first = chainstate.GetBlockAtHeight(2);
        const CBlockIndex* first_of_second = chainstate.GetBlockAtHeight(3);
        auto expected = accumulator::AccumulatorState::Empty(8)
                            .Append(last_of_first->accumulator.GetCheckpointDigest())
                            .Append(first_of_second->GetDigest());
        REQUIRE(first_of_second->accumulator == expected);
    }
}
