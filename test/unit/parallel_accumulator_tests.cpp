// Copyright (c) 2024 FoldChain
// Unit tests for thread-pool accumulation and folding

#include <catch2/catch_test_macros.hpp>
#include "accumulator/parallel.hpp"
#include "test_helpers.hpp"

using namespace foldchain;
using namespace foldchain::accumulator;
using foldchain::test::MakeDigests;

TEST_CASE("AccumulateParallel - Matches sequential accumulation", "[accumulator][parallel]") {
    util::ThreadPool pool(4);

    SECTION("Full capacity") {
        auto digests = MakeDigests(128, 17);
        REQUIRE(AccumulateParallel(digests, pool) == Accumulate(digests));
    }

    SECTION("Uneven slices") {
        auto digests = MakeDigests(37, 18);
        REQUIRE(AccumulateParallel(digests, pool, DEFAULT_DOMAIN_SIZE, 5) == Accumulate(digests));
    }

    SECTION("Small inputs take the sequential path") {
        auto digests = MakeDigests(3, 19);
        REQUIRE(AccumulateParallel(digests, pool) == Accumulate(digests));
        REQUIRE(AccumulateParallel({}, pool) == AccumulatorState::Empty());
    }

    SECTION("Too many digests throw DegreeExceeded") {
        auto digests = MakeDigests(129, 20);
        REQUIRE_THROWS_AS(AccumulateParallel(digests, pool), ProofError);
    }
}

TEST_CASE("FoldAll - Balanced fold of partial states", "[accumulator][parallel]") {
    util::ThreadPool pool(3);

    SECTION("Odd number of states") {
        std::vector<AccumulatorState> states;
        std::vector<crypto::FieldElement> all;
        for (uint32_t i = 0; i < 5; i++) {
            auto part = MakeDigests(4, 100 + i);
            all.insert(all.end(), part.begin(), part.end());
            states.push_back(Accumulate(part));
        }
        REQUIRE(FoldAll(states, pool) == Accumulate(all));
    }

    SECTION("No states folds to Empty") {
        REQUIRE(FoldAll({}, pool, 64) == AccumulatorState::Empty(64));
    }

    SECTION("Single state is returned unchanged") {
        auto state = Accumulate(MakeDigests(6, 3));
        REQUIRE(FoldAll({state}, pool) == state);
    }

    SECTION("Mismatched domains propagate SizeMismatch") {
        std::vector<AccumulatorState> states = {Accumulate(MakeDigests(2, 1), 64),
                                                Accumulate(MakeDigests(2, 2), 128)};
        try {
            (void)FoldAll(states, pool, 64);
            FAIL("expected ProofError");
        } catch (const ProofError& e) {
            REQUIRE(e.code() == ProofError::Code::SizeMismatch);
        }
    }
}
