// Copyright (c) 2024 FoldChain
// Unit tests for the block validation layers

#include <catch2/catch_test_macros.hpp>
#include "chain/block_manager.hpp"
#include "validation/validation.hpp"
#include "util/time.hpp"
#include "test_helpers.hpp"

using namespace foldchain;
using namespace foldchain::chain;
using namespace foldchain::validation;
using foldchain::test::BuildBlock;
using foldchain::test::Record;

namespace {

class ValidationFixture {
public:
    explicit ValidationFixture(ConsensusOverrides overrides = {})
        : params(ChainParams::CreateRegTest(overrides))
    {
        REQUIRE(bm.Initialize(params->GenesisBlock()));
        genesis = bm.LookupBlockIndex(params->GenesisBlock().GetHash());
    }

    CBlockIndex* Index(const CBlock& block)
    {
        CBlockIndex* pindex = bm.AddToBlockIndex(block);
        REQUIRE(pindex != nullptr);
        return pindex;
    }

    std::unique_ptr<ChainParams> params;
    BlockManager bm;
    CBlockIndex* genesis{nullptr};
};

} // namespace

TEST_CASE("CheckBlock - Payload commitment", "[validation]") {
    ValidationFixture f;
    ValidationState state;

    SECTION("Assembled block passes") {
        CBlock block = BuildBlock(*f.params, *f.genesis, 1, 1, {Record("a"), Record("b")});
        REQUIRE(CheckBlock(block, *f.params, state));
        REQUIRE(state.IsValid());
    }

    SECTION("Altered payload is MUTATED") {
        CBlock block = BuildBlock(*f.params, *f.genesis, 1, 1, {Record("a"), Record("b")});
        block.vPayload[1] = Record("c");
        REQUIRE_FALSE(CheckBlock(block, *f.params, state));
        REQUIRE(state.IsInvalid());
        REQUIRE(state.GetResult() == BlockValidationResult::MUTATED);
        REQUIRE(state.GetRejectReason() == "bad-merkle-root");
    }

    SECTION("Duplicated subtree is MUTATED even with a matching root") {
        CBlock block = BuildBlock(*f.params, *f.genesis, 1, 1,
                                  {Record("x"), Record("y"), Record("z"), Record("z")});
        REQUIRE_FALSE(CheckBlock(block, *f.params, state));
        REQUIRE(state.GetResult() == BlockValidationResult::MUTATED);
        REQUIRE(state.GetRejectReason() == "bad-merkle-mutated");
    }

    SECTION("Wrong accumulator domain") {
        CBlock block = BuildBlock(*f.params, *f.genesis, 1);
        block.accumulator = accumulator::AccumulatorState::Empty(128);
        REQUIRE_FALSE(CheckBlock(block, *f.params, state));
        REQUIRE(state.GetResult() == BlockValidationResult::PROOF_SIZE_MISMATCH);
        REQUIRE(IsProofFailure(state.GetResult()));
    }
}

TEST_CASE("ContextualCheckBlock - Slot rules", "[validation]") {
    ValidationFixture f;
    ValidationState state;
    CBlockIndex* b1 = f.Index(BuildBlock(*f.params, *f.genesis, 5));

    SECTION("Slot must exceed the parent's") {
        CBlock same = BuildBlock(*f.params, *b1, 5);
        REQUIRE_FALSE(ContextualCheckBlock(same, b1, *f.params, 10, state));
        REQUIRE(state.GetResult() == BlockValidationResult::SLOT_ORDER_VIOLATION);

        ValidationState state2;
        CBlock earlier = BuildBlock(*f.params, *b1, 4);
        REQUIRE_FALSE(ContextualCheckBlock(earlier, b1, *f.params, 10, state2));
        REQUIRE(state2.GetResult() == BlockValidationResult::SLOT_ORDER_VIOLATION);
    }

    SECTION("Future slot bound is current slot plus the allowance") {
        // Regtest allows two slots ahead
        CBlock at_bound = BuildBlock(*f.params, *b1, 12);
        REQUIRE(ContextualCheckBlock(at_bound, b1, *f.params, 10, state));

        CBlock beyond = BuildBlock(*f.params, *b1, 13);
        REQUIRE_FALSE(ContextualCheckBlock(beyond, b1, *f.params, 10, state));
        REQUIRE(state.GetResult() == BlockValidationResult::FUTURE_SLOT);
        REQUIRE(state.GetRejectReason() == "future-slot");
    }

    SECTION("Missing parent") {
        CBlock block = BuildBlock(*f.params, *b1, 6);
        REQUIRE_FALSE(ContextualCheckBlock(block, nullptr, *f.params, 10, state));
        REQUIRE(state.GetResult() == BlockValidationResult::UNKNOWN_PARENT);
    }
}

TEST_CASE("CheckBlockAccumulator - State must extend the parent", "[validation]") {
    ValidationFixture f;
    ValidationState state;

    SECTION("Assembled block passes") {
        CBlock block = BuildBlock(*f.params, *f.genesis, 1);
        REQUIRE(CheckBlockAccumulator(block, f.genesis, *f.params, state));
    }

    SECTION("Foreign digest fails membership") {
        CBlock block = BuildBlock(*f.params, *f.genesis, 1);
        block.accumulator = f.genesis->accumulator.Append(crypto::FieldElement(12345));
        REQUIRE_FALSE(CheckBlockAccumulator(block, f.genesis, *f.params, state));
        REQUIRE(state.GetResult() == BlockValidationResult::PROOF_MEMBERSHIP_FAILED);
        REQUIRE(state.GetRejectReason() == "bad-accumulator");
    }

    SECTION("Parent state without the new digest fails") {
        CBlock block = BuildBlock(*f.params, *f.genesis, 1);
        block.accumulator = f.genesis->accumulator;
        REQUIRE_FALSE(CheckBlockAccumulator(block, f.genesis, *f.params, state));
        REQUIRE(IsProofFailure(state.GetResult()));
    }

    SECTION("State built on another parent fails") {
        CBlockIndex* a1 = f.Index(BuildBlock(*f.params, *f.genesis, 1, 1));
        CBlockIndex* b1 = f.Index(BuildBlock(*f.params, *f.genesis, 1, 2));
        CBlock child = BuildBlock(*f.params, *a1, 2);
        REQUIRE(CheckBlockAccumulator(child, a1, *f.params, state));

        ValidationState state2;
        REQUIRE_FALSE(CheckBlockAccumulator(child, b1, *f.params, state2));
        REQUIRE(IsProofFailure(state2.GetResult()));
    }

    SECTION("ValidateBlock runs every layer") {
        CBlock block = BuildBlock(*f.params, *f.genesis, 1);
        REQUIRE(ValidateBlock(block, f.genesis, *f.params, 1, state));

        ValidationState state2;
        block.accumulator = f.genesis->accumulator;
        REQUIRE_FALSE(ValidateBlock(block, f.genesis, *f.params, 1, state2));
    }
}

TEST_CASE("CheckBlockAccumulator - Epoch boundary", "[validation]") {
    // N = 8: epochs of three blocks
    ConsensusOverrides overrides;
    overrides.accumulator_domain_size = 8;
    ValidationFixture f(overrides);
    ValidationState state;

    CBlockIndex* tip = f.genesis;
    for (uint64_t slot = 1; slot <= 2; slot++) {
        CBlock block = BuildBlock(*f.params, *tip, slot);
        REQUIRE(CheckBlockAccumulator(block, tip, *f.params, state));
        tip = f.Index(block);
    }
    REQUIRE(tip->accumulator.Count() == 3);

    SECTION("Height 3 starts a new epoch from the checkpoint") {
        CBlock block = BuildBlock(*f.params, *tip, 3);
        REQUIRE(block.accumulator.Count() == 2);
        REQUIRE(CheckBlockAccumulator(block, tip, *f.params, state));
    }

    SECTION("Continuing the previous epoch's state is rejected") {
        CBlock block = BuildBlock(*f.params, *tip, 3);
        block.accumulator = tip->accumulator.Append(block.GetDigest());
        REQUIRE_FALSE(CheckBlockAccumulator(block, tip, *f.params, state));
        REQUIRE(IsProofFailure(state.GetResult()));
    }
}

TEST_CASE("Validation result names", "[validation]") {
    REQUIRE(std::string(BlockValidationResultToString(BlockValidationResult::FUTURE_SLOT)) == "future-slot");
    REQUIRE(std::string(BlockValidationResultToString(BlockValidationResult::MUTATED)) == "mutated");
    REQUIRE(ProofErrorToValidationResult(accumulator::ProofError::Code::DegreeExceeded) ==
            BlockValidationResult::PROOF_DEGREE_EXCEEDED);
    REQUIRE_FALSE(IsProofFailure(BlockValidationResult::SLOT_ORDER_VIOLATION));

    REQUIRE(IsHeaderFailure(BlockValidationResult::SLOT_ORDER_VIOLATION));
    REQUIRE_FALSE(IsHeaderFailure(BlockValidationResult::MUTATED));
    REQUIRE_FALSE(IsHeaderFailure(BlockValidationResult::FUTURE_SLOT));
    REQUIRE_FALSE(IsHeaderFailure(BlockValidationResult::PROOF_MEMBERSHIP_FAILED));
    REQUIRE_FALSE(IsHeaderFailure(BlockValidationResult::PROOF_SIZE_MISMATCH));
}

TEST_CASE("GetCurrentSlot follows the clock", "[validation]") {
    auto params = ChainParams::CreateRegTest();
    const int64_t genesis_time = params->GetConsensus().nGenesisTime;
    {
        util::MockTimeScope mock(genesis_time + 42);
        REQUIRE(GetCurrentSlot(*params) == 42);
    }
    {
        util::MockTimeScope mock(genesis_time - 100);
        REQUIRE(GetCurrentSlot(*params) == 0);
    }
}
