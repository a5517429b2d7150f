// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "chain/chainparams.hpp"
#include "accumulator/epoch.hpp"
#include "crypto/merkle.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace foldchain {
namespace chain {

uint64_t ConsensusParams::SlotAt(int64_t now) const {
  if (now <= nGenesisTime || nSlotDuration <= 0) {
    return 0;
  }
  return static_cast<uint64_t>((now - nGenesisTime) / nSlotDuration);
}

CBlock CreateGenesisBlock(const std::string &message, size_t domain_size) {
  CBlock genesis;
  genesis.hashPrevBlock.SetNull();
  genesis.nSlot = 0;
  genesis.producer.SetNull();
  genesis.vPayload.emplace_back(message.begin(), message.end());
  genesis.hashMerkleRoot = crypto::ComputeMerkleRoot(genesis.vPayload);
  genesis.accumulator = accumulator::NextAccumulatorState(
      accumulator::AccumulatorState(), 0, genesis.GetDigest(), domain_size);
  return genesis;
}

std::string ChainParams::GetChainTypeString() const {
  switch (chainType) {
  case ChainType::MAIN:
    return "main";
  case ChainType::TESTNET:
    return "test";
  case ChainType::REGTEST:
    return "regtest";
  }
  return "unknown";
}

std::unique_ptr<ChainParams> ChainParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateTestNet() {
  return std::make_unique<CTestNetParams>();
}

std::unique_ptr<ChainParams>
ChainParams::CreateRegTest(const ConsensusOverrides &overrides) {
  return std::make_unique<CRegTestParams>(overrides);
}

void ChainParams::Finish(const std::string &genesis_message) {
  const auto &c = consensus;
  if (c.nWindowSize == 0) {
    throw std::invalid_argument("window size must be positive");
  }
  if (c.nConfirmationDepth < 1) {
    throw std::invalid_argument("confirmation depth must be at least 1");
  }
  if (c.nSlotDuration <= 0) {
    throw std::invalid_argument("slot duration must be positive");
  }
  // AccumulatorState::Empty rejects unsupported domains; epochs need room for
  // at least one block besides the checkpoint
  if (c.nAccumulatorDomainSize < accumulator::MIN_DOMAIN_SIZE ||
      c.nAccumulatorDomainSize > accumulator::MAX_DOMAIN_SIZE ||
      c.nAccumulatorDomainSize % 2 != 0) {
    throw std::invalid_argument("unsupported accumulator domain size " +
                                std::to_string(c.nAccumulatorDomainSize));
  }

  genesis = CreateGenesisBlock(genesis_message, c.nAccumulatorDomainSize);
  consensus.hashGenesisBlock = genesis.GetHash();

  LOG_CHAIN_DEBUG("{} params: W={} depth={} N={} genesis={}",
                  GetChainTypeString(), c.nWindowSize, c.nConfirmationDepth,
                  c.nAccumulatorDomainSize,
                  consensus.hashGenesisBlock.ToString().substr(0, 16));
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams() {
  chainType = ChainType::MAIN;

  consensus.nWindowSize = 20;
  consensus.nConfirmationDepth = 6;
  consensus.nMaxFutureSlots = 2;
  consensus.nSlotDuration = 6;
  consensus.nGenesisTime = 1760292878; // Oct 12, 2025
  consensus.nAccumulatorDomainSize = 256;

  Finish("FoldChain main genesis");
}

// ============================================================================
// TestNet Parameters
// ============================================================================

CTestNetParams::CTestNetParams() {
  chainType = ChainType::TESTNET;

  consensus.nWindowSize = 20;
  consensus.nConfirmationDepth = 6;
  consensus.nMaxFutureSlots = 2;
  consensus.nSlotDuration = 2; // fast slots for testing
  consensus.nGenesisTime = 1760292878;
  consensus.nAccumulatorDomainSize = 256;

  Finish("FoldChain test genesis");
}

// ============================================================================
// RegTest Parameters
// ============================================================================

CRegTestParams::CRegTestParams(const ConsensusOverrides &overrides) {
  chainType = ChainType::REGTEST;

  consensus.nWindowSize = overrides.window_size.value_or(20);
  consensus.nConfirmationDepth = overrides.confirmation_depth.value_or(6);
  consensus.nMaxFutureSlots = overrides.max_future_slots.value_or(2);
  consensus.nSlotDuration = overrides.slot_duration.value_or(1);
  consensus.nGenesisTime = overrides.genesis_time.value_or(1700000000);
  consensus.nAccumulatorDomainSize =
      overrides.accumulator_domain_size.value_or(256);

  Finish("FoldChain regtest genesis");
}

} // namespace chain
} // namespace foldchain
