// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "primitives/block.hpp"
#include "crypto/sha256.hpp"
#include "util/endian.hpp"
#include <algorithm>
#include <sstream>

namespace foldchain {

namespace {
// Fails to compile if the field layout drifts from HEADER_SIZE
static constexpr size_t kHeaderSize = 32 /*hashPrevBlock*/ + 8 /*nSlot*/ +
                                      32 /*hashMerkleRoot*/ + 20 /*producer*/;
static_assert(kHeaderSize == CBlockHeader::HEADER_SIZE, "HEADER_SIZE mismatch");
} // namespace

uint256 CBlockHeader::GetHash() const {
  const auto s = SerializeFixed();
  return crypto::Hash256(s);
}

crypto::FieldElement CBlockHeader::GetDigest() const {
  return crypto::FieldElement::FromHash(GetHash());
}

CBlockHeader::HeaderBytes CBlockHeader::SerializeFixed() const noexcept {
  // Consensus-critical layout; changing it changes every block identifier
  HeaderBytes data{};

  // uint256/uint160 are already in internal byte order, copied as-is
  std::copy(hashPrevBlock.begin(), hashPrevBlock.end(),
            data.begin() + OFF_PREV);
  endian::WriteLE64(data.data() + OFF_SLOT, nSlot);
  std::copy(hashMerkleRoot.begin(), hashMerkleRoot.end(),
            data.begin() + OFF_MERKLE);
  std::copy(producer.begin(), producer.end(), data.begin() + OFF_PRODUCER);

  return data;
}

std::vector<uint8_t> CBlockHeader::Serialize() const {
  auto arr = SerializeFixed();
  return std::vector<uint8_t>(arr.begin(), arr.end());
}

bool CBlockHeader::Deserialize(const uint8_t *data, size_t size) noexcept {
  if (size != HEADER_SIZE) {
    return false;
  }

  std::copy(data + OFF_PREV, data + OFF_PREV + UINT256_BYTES,
            hashPrevBlock.begin());
  nSlot = endian::ReadLE64(data + OFF_SLOT);
  std::copy(data + OFF_MERKLE, data + OFF_MERKLE + UINT256_BYTES,
            hashMerkleRoot.begin());
  std::copy(data + OFF_PRODUCER, data + OFF_PRODUCER + UINT160_BYTES,
            producer.begin());

  return true;
}

std::string CBlockHeader::ToString() const {
  std::stringstream s;
  s << "CBlockHeader(\n";
  s << "  hashPrevBlock=" << hashPrevBlock.GetHex() << "\n";
  s << "  nSlot=" << nSlot << "\n";
  s << "  hashMerkleRoot=" << hashMerkleRoot.GetHex() << "\n";
  s << "  producer=" << producer.GetHex() << "\n";
  s << "  hash=" << GetHash().GetHex() << "\n";
  s << ")\n";
  return s.str();
}

std::vector<uint8_t> CBlock::SerializeBlock() const {
  std::vector<uint8_t> out = Serialize();
  accumulator.SerializeTo(out);

  uint8_t buf[4];
  endian::WriteLE32(buf, static_cast<uint32_t>(vPayload.size()));
  out.insert(out.end(), buf, buf + 4);
  for (const auto &record : vPayload) {
    endian::WriteLE32(buf, static_cast<uint32_t>(record.size()));
    out.insert(out.end(), buf, buf + 4);
    out.insert(out.end(), record.begin(), record.end());
  }
  return out;
}

bool CBlock::DeserializeBlock(std::span<const uint8_t> data) noexcept {
  if (data.size() < HEADER_SIZE ||
      !Deserialize(data.data(), HEADER_SIZE)) {
    return false;
  }
  size_t pos = HEADER_SIZE;

  size_t consumed = 0;
  if (!accumulator::AccumulatorState::Deserialize(data.subspan(pos),
                                                  accumulator, consumed)) {
    return false;
  }
  pos += consumed;

  if (data.size() - pos < 4) {
    return false;
  }
  const uint32_t count = endian::ReadLE32(data.data() + pos);
  pos += 4;
  if (count > MAX_PAYLOAD_RECORDS) {
    return false;
  }

  try {
    std::vector<std::vector<uint8_t>> records;
    records.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
      if (data.size() - pos < 4) {
        return false;
      }
      const uint32_t len = endian::ReadLE32(data.data() + pos);
      pos += 4;
      if (len > MAX_RECORD_SIZE || data.size() - pos < len) {
        return false;
      }
      records.emplace_back(data.begin() + pos, data.begin() + pos + len);
      pos += len;
    }
    // Trailing bytes are a malformed encoding
    if (pos != data.size()) {
      return false;
    }
    vPayload = std::move(records);
  } catch (const std::bad_alloc &) {
    return false;
  }
  return true;
}

std::string CBlock::ToString() const {
  std::stringstream s;
  s << "CBlock(hash=" << GetHash().GetHex().substr(0, 16)
    << ", slot=" << nSlot << ", records=" << vPayload.size()
    << ", accumulator=" << accumulator.ToString() << ")";
  return s.str();
}

} // namespace foldchain
