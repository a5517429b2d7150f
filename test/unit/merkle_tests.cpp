// Copyright (c) 2024 FoldChain
// Unit tests for the payload Merkle commitment

#include <catch2/catch_test_macros.hpp>
#include "crypto/merkle.hpp"
#include "test_helpers.hpp"

using namespace foldchain;
using namespace foldchain::crypto;
using foldchain::test::Record;

namespace {

MerkleLeaves MakeLeaves(size_t count)
{
    MerkleLeaves leaves;
    for (size_t i = 0; i < count; i++) {
        leaves.push_back(Record("record-" + std::to_string(i)));
    }
    return leaves;
}

} // namespace

TEST_CASE("Merkle - Root computation", "[merkle]") {
    SECTION("Empty payload has the zero root") {
        REQUIRE(ComputeMerkleRoot({}) == uint256::ZERO);
    }

    SECTION("Single leaf root is the leaf hash") {
        auto leaves = MakeLeaves(1);
        REQUIRE(ComputeMerkleRoot(leaves) == MerkleLeafHash(leaves[0]));
    }

    SECTION("Two leaves hash as one node") {
        auto leaves = MakeLeaves(2);
        REQUIRE(ComputeMerkleRoot(leaves) ==
                MerkleNodeHash(MerkleLeafHash(leaves[0]), MerkleLeafHash(leaves[1])));
    }

    SECTION("Leaf and node hashes are domain separated") {
        auto leaves = MakeLeaves(2);
        const uint256 left = MerkleLeafHash(leaves[0]);
        const uint256 right = MerkleLeafHash(leaves[1]);
        std::vector<uint8_t> concatenated(left.begin(), left.end());
        concatenated.insert(concatenated.end(), right.begin(), right.end());
        REQUIRE(MerkleLeafHash(concatenated) != MerkleNodeHash(left, right));
    }

    SECTION("Root depends on order") {
        auto leaves = MakeLeaves(4);
        auto swapped = leaves;
        std::swap(swapped[0], swapped[1]);
        REQUIRE(ComputeMerkleRoot(leaves) != ComputeMerkleRoot(swapped));
    }

    SECTION("Root is deterministic") {
        REQUIRE(ComputeMerkleRoot(MakeLeaves(7)) == ComputeMerkleRoot(MakeLeaves(7)));
    }
}

TEST_CASE("Merkle - Mutation detection", "[merkle]") {
    SECTION("Distinct leaves are not mutated") {
        bool mutated = true;
        ComputeMerkleRoot(MakeLeaves(5), &mutated);
        REQUIRE_FALSE(mutated);
    }

    SECTION("Duplicated adjacent leaves are flagged") {
        auto leaves = MakeLeaves(2);
        leaves[1] = leaves[0];
        bool mutated = false;
        ComputeMerkleRoot(leaves, &mutated);
        REQUIRE(mutated);
    }

    SECTION("Appending the odd last leaf reproduces the root but is flagged") {
        auto leaves = MakeLeaves(3);
        auto padded = leaves;
        padded.push_back(leaves[2]);
        bool mutated = false;
        REQUIRE(ComputeMerkleRoot(padded, &mutated) == ComputeMerkleRoot(leaves));
        REQUIRE(mutated);
    }
}

TEST_CASE("Merkle - Inclusion proofs", "[merkle]") {
    SECTION("Every leaf of odd and even trees verifies") {
        for (size_t count : {1u, 2u, 3u, 5u, 8u, 13u}) {
            auto leaves = MakeLeaves(count);
            const uint256 root = ComputeMerkleRoot(leaves);
            for (size_t i = 0; i < count; i++) {
                auto proof = BuildMerkleProof(leaves, i);
                REQUIRE(proof.has_value());
                REQUIRE(proof->index == i);
                REQUIRE(VerifyMerkleProof(root, leaves[i], *proof));
            }
        }
    }

    SECTION("Out-of-range index has no proof") {
        REQUIRE_FALSE(BuildMerkleProof(MakeLeaves(4), 4).has_value());
        REQUIRE_FALSE(BuildMerkleProof({}, 0).has_value());
    }

    SECTION("Proof fails for a different record") {
        auto leaves = MakeLeaves(6);
        const uint256 root = ComputeMerkleRoot(leaves);
        auto proof = BuildMerkleProof(leaves, 2);
        REQUIRE(proof.has_value());
        REQUIRE_FALSE(VerifyMerkleProof(root, leaves[3], *proof));
        REQUIRE_FALSE(VerifyMerkleProof(root, Record("forged"), *proof));
    }

    SECTION("Proof fails with a wrong index or tampered sibling") {
        auto leaves = MakeLeaves(8);
        const uint256 root = ComputeMerkleRoot(leaves);
        auto proof = BuildMerkleProof(leaves, 5);
        REQUIRE(proof.has_value());

        MerkleProof wrong_index = *proof;
        wrong_index.index = 4;
        REQUIRE_FALSE(VerifyMerkleProof(root, leaves[5], wrong_index));

        MerkleProof out_of_range = *proof;
        out_of_range.index = 8;
        REQUIRE_FALSE(VerifyMerkleProof(root, leaves[5], out_of_range));

        MerkleProof tampered = *proof;
        tampered.siblings[1].data()[0] ^= 0x01;
        REQUIRE_FALSE(VerifyMerkleProof(root, leaves[5], tampered));
    }

    SECTION("MerkleTree exposes the same root and proofs") {
        auto leaves = MakeLeaves(9);
        MerkleTree tree(leaves);
        REQUIRE(tree.LeafCount() == 9);
        REQUIRE_FALSE(tree.IsMutated());
        REQUIRE(tree.Root() == ComputeMerkleRoot(leaves));
        REQUIRE(tree.Prove(8) == BuildMerkleProof(leaves, 8));
    }
}
