// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_PRIMITIVES_BLOCK_HPP
#define FOLDCHAIN_PRIMITIVES_BLOCK_HPP

#include "accumulator/reed_solomon.hpp"
#include "chain/uint.hpp"
#include "crypto/field.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace foldchain {

/**
 * Block header
 *
 * The header is what the block identifier commits to:
 *   hashPrevBlock   parent identifier (null for genesis)
 *   nSlot           slot number, strictly increasing along a chain
 *   hashMerkleRoot  Merkle root of the payload records
 *   producer        producer identity
 *
 * Wire format (92 bytes, all little-endian):
 *   0   hashPrevBlock  32
 *   32  nSlot           8
 *   40  hashMerkleRoot 32
 *   72  producer       20
 */
class CBlockHeader {
public:
  static constexpr size_t UINT256_BYTES = 32;
  static constexpr size_t UINT160_BYTES = 20;

  static constexpr size_t OFF_PREV = 0;
  static constexpr size_t OFF_SLOT = OFF_PREV + UINT256_BYTES;
  static constexpr size_t OFF_MERKLE = OFF_SLOT + 8;
  static constexpr size_t OFF_PRODUCER = OFF_MERKLE + UINT256_BYTES;
  static constexpr size_t HEADER_SIZE = OFF_PRODUCER + UINT160_BYTES;

  using HeaderBytes = std::array<uint8_t, HEADER_SIZE>;

  uint256 hashPrevBlock;
  uint64_t nSlot{0};
  uint256 hashMerkleRoot;
  uint160 producer;

  CBlockHeader() = default;

  void SetNull() noexcept {
    hashPrevBlock.SetNull();
    nSlot = 0;
    hashMerkleRoot.SetNull();
    producer.SetNull();
  }

  // Block identifier: double SHA-256 of the serialized header
  [[nodiscard]] uint256 GetHash() const;

  // Block digest: the identifier reduced into the field. This is the value
  // appended to the accumulator.
  [[nodiscard]] crypto::FieldElement GetDigest() const;

  [[nodiscard]] HeaderBytes SerializeFixed() const noexcept;
  [[nodiscard]] std::vector<uint8_t> Serialize() const;

  // Rejects any size other than HEADER_SIZE
  [[nodiscard]] bool Deserialize(const uint8_t *data, size_t size) noexcept;

  std::string ToString() const;
};

/**
 * Full block: header, the accumulator state covering the chain up to and
 * including this block, and the payload records committed by the Merkle
 * root.
 *
 * Blocks are produced once and never modified afterwards.
 *
 * Serialization: header (92) | accumulator state | u32 record count |
 * per record: u32 length, bytes
 */
class CBlock : public CBlockHeader {
public:
  static constexpr size_t MAX_PAYLOAD_RECORDS = 4096;
  static constexpr size_t MAX_RECORD_SIZE = 1 << 20;

  accumulator::AccumulatorState accumulator;
  std::vector<std::vector<uint8_t>> vPayload;

  CBlock() = default;

  explicit CBlock(const CBlockHeader &header) : CBlockHeader(header) {}

  [[nodiscard]] CBlockHeader GetBlockHeader() const {
    return static_cast<const CBlockHeader &>(*this);
  }

  [[nodiscard]] std::vector<uint8_t> SerializeBlock() const;
  [[nodiscard]] bool DeserializeBlock(std::span<const uint8_t> data) noexcept;

  std::string ToString() const;
};

} // namespace foldchain

#endif // FOLDCHAIN_PRIMITIVES_BLOCK_HPP
