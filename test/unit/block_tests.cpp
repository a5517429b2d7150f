// Copyright (c) 2024 FoldChain
// Unit tests for block header and block serialization

#include <catch2/catch_test_macros.hpp>
#include "primitives/block.hpp"
#include "test_helpers.hpp"

using namespace foldchain;
using foldchain::test::MakeProducer;
using foldchain::test::Record;

namespace {

CBlock MakeBlock()
{
    CBlock block;
    block.hashPrevBlock = uint256S("0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20");
    block.nSlot = 42;
    block.producer = MakeProducer(7);
    block.vPayload = {Record("alpha"), Record("beta"), {}};
    block.hashMerkleRoot = crypto::ComputeMerkleRoot(block.vPayload);
    block.accumulator = accumulator::AccumulatorState::Empty(16).Append(crypto::FieldElement(9));
    return block;
}

} // namespace

TEST_CASE("CBlockHeader - Fixed layout", "[block]") {
    SECTION("Header is 92 bytes") {
        REQUIRE(CBlockHeader::HEADER_SIZE == 92);
        REQUIRE(CBlockHeader().Serialize().size() == 92);
    }

    SECTION("Slot is little-endian at its offset") {
        CBlockHeader header;
        header.nSlot = 0x0102030405060708ULL;
        auto bytes = header.SerializeFixed();
        REQUIRE(bytes[CBlockHeader::OFF_SLOT] == 0x08);
        REQUIRE(bytes[CBlockHeader::OFF_SLOT + 7] == 0x01);
    }

    SECTION("Round trip") {
        CBlock block = MakeBlock();
        auto bytes = block.Serialize();
        CBlockHeader decoded;
        REQUIRE(decoded.Deserialize(bytes.data(), bytes.size()));
        REQUIRE(decoded.GetHash() == block.GetHash());
        REQUIRE(decoded.nSlot == 42);
        REQUIRE(decoded.producer == block.producer);
    }

    SECTION("Wrong size is rejected") {
        std::vector<uint8_t> short_bytes(91);
        CBlockHeader decoded;
        REQUIRE_FALSE(decoded.Deserialize(short_bytes.data(), short_bytes.size()));
    }
}

TEST_CASE("CBlockHeader - Identifier and digest", "[block]") {
    CBlock block = MakeBlock();

    SECTION("Every header field changes the identifier") {
        const uint256 base = block.GetHash();

        CBlockHeader h = block.GetBlockHeader();
        h.nSlot++;
        REQUIRE(h.GetHash() != base);

        h = block.GetBlockHeader();
        h.producer = MakeProducer(8);
        REQUIRE(h.GetHash() != base);

        h = block.GetBlockHeader();
        h.hashMerkleRoot.SetNull();
        REQUIRE(h.GetHash() != base);

        h = block.GetBlockHeader();
        h.hashPrevBlock.SetNull();
        REQUIRE(h.GetHash() != base);
    }

    SECTION("Identifier does not cover payload or accumulator") {
        CBlock other = block;
        other.vPayload.push_back(Record("extra"));
        other.accumulator = accumulator::AccumulatorState::Empty(16);
        REQUIRE(other.GetHash() == block.GetHash());
    }

    SECTION("Digest is the identifier reduced into the field") {
        REQUIRE(block.GetDigest() == crypto::FieldElement::FromHash(block.GetHash()));
    }
}

TEST_CASE("CBlock - Serialization", "[block]") {
    CBlock block = MakeBlock();

    SECTION("Round trip preserves every field") {
        auto bytes = block.SerializeBlock();
        CBlock decoded;
        REQUIRE(decoded.DeserializeBlock(bytes));
        REQUIRE(decoded.GetHash() == block.GetHash());
        REQUIRE(decoded.accumulator == block.accumulator);
        REQUIRE(decoded.vPayload == block.vPayload);
        REQUIRE(decoded.SerializeBlock() == bytes);
    }

    SECTION("Trailing bytes are rejected") {
        auto bytes = block.SerializeBlock();
        bytes.push_back(0);
        CBlock decoded;
        REQUIRE_FALSE(decoded.DeserializeBlock(bytes));
    }

    SECTION("Truncations are rejected") {
        auto bytes = block.SerializeBlock();
        CBlock decoded;
        for (size_t cut : {size_t{0}, size_t{50}, size_t{100}, bytes.size() - 1}) {
            std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + cut);
            REQUIRE_FALSE(decoded.DeserializeBlock(truncated));
        }
    }

    SECTION("Oversized record count is rejected") {
        CBlock empty_payload = block;
        empty_payload.vPayload.clear();
        auto bytes = empty_payload.SerializeBlock();
        // Record count is the last four bytes
        const size_t pos = bytes.size() - 4;
        bytes[pos] = 0xff;
        bytes[pos + 1] = 0xff;
        CBlock decoded;
        REQUIRE_FALSE(decoded.DeserializeBlock(bytes));
    }

    SECTION("ToString mentions slot and record count") {
        const std::string s = block.ToString();
        REQUIRE(s.find("slot=42") != std::string::npos);
        REQUIRE(s.find("records=3") != std::string::npos);
    }
}
